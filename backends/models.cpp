#include "modelgate.h"
#include "models.h"

using modelgate::contains;

ModelFamily Models::detect_family(const std::string& model_id) {
    if (model_id.empty()) {
        LOG_DEBUG("Empty model id, using chatml");
        return ModelFamily::CHATML;
    }

    // Convert to lowercase for case-insensitive matching
    std::string model_lower = modelgate::to_lower(model_id);

    if (contains(model_lower, "qwen")) {
        return ModelFamily::QWEN;
    }

    if (contains(model_lower, "llama")) {
        return is_llama3(model_lower) ? ModelFamily::LLAMA_3 : ModelFamily::LLAMA_2;
    }

    if (contains(model_lower, "mistral") || contains(model_lower, "mixtral")) {
        return ModelFamily::MISTRAL;
    }

    if (contains(model_lower, "gemma")) {
        return ModelFamily::GEMMA;
    }

    // Phi and SmolLM ship ChatML-compatible templates; no dedicated markup
    if (contains(model_lower, "phi") || contains(model_lower, "smollm")) {
        LOG_DEBUG("Model " + model_id + " has no dedicated template, using chatml");
    }

    return ModelFamily::CHATML;
}

bool Models::is_llama3(const std::string& model_id) {
    std::string model_lower = modelgate::to_lower(model_id);
    return contains(model_lower, "llama-3") || contains(model_lower, "llama3");
}

std::string Models::family_name(ModelFamily family) {
    switch (family) {
        case ModelFamily::QWEN: return "qwen";
        case ModelFamily::LLAMA_2: return "llama2";
        case ModelFamily::LLAMA_3: return "llama3";
        case ModelFamily::MISTRAL: return "mistral";
        case ModelFamily::GEMMA: return "gemma";
        case ModelFamily::CHATML: return "chatml";
    }
    return "chatml";
}

std::string Models::image_token(const std::string& model_id, size_t image_index) {
    std::string model_lower = modelgate::to_lower(model_id);

    if (contains(model_lower, "qwen") && contains(model_lower, "vl")) {
        return "<image_" + std::to_string(image_index + 1) + ">";
    }

    return "<image>";
}

std::string Models::to_display_name(const std::string& local_name) {
    static const char* org_prefixes[] = {
        "mlx-community_", "huggingface_", "meta-llama_", "mistralai_",
        "Qwen_", "google_", "microsoft_"
    };

    for (const char* prefix : org_prefixes) {
        std::string p(prefix);
        if (local_name.compare(0, p.size(), p) == 0) {
            return p.substr(0, p.size() - 1) + "/" + local_name.substr(p.size());
        }
    }
    return local_name;
}

std::string Models::to_local_name(const std::string& model_id) {
    std::string local = model_id;
    std::replace(local.begin(), local.end(), '/', '_');
    return local;
}
