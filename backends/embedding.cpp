#include "modelgate.h"
#include "embedding.h"

namespace Embedding {

namespace {

// "e5" as its own name component: intfloat/e5-large, multilingual-e5-base, e5_small.
// Rejects incidental matches such as "phi-3-e50" or "be5t".
bool has_e5_component(const std::string& model_lower) {
    size_t pos = model_lower.find("e5");
    while (pos != std::string::npos) {
        bool start_ok = pos == 0 || model_lower[pos - 1] == '/' ||
                        model_lower[pos - 1] == '-' || model_lower[pos - 1] == '_';
        size_t after = pos + 2;
        bool end_ok = after == model_lower.size() || model_lower[after] == '-' ||
                      model_lower[after] == '_' || model_lower[after] == '.';
        if (start_ok && end_ok) return true;
        pos = model_lower.find("e5", pos + 1);
    }
    return false;
}

} // namespace

EmbeddingStrategy select_strategy(const std::string& model_id) {
    std::string model_lower = modelgate::to_lower(model_id);

    if (modelgate::contains(model_lower, "bert") || has_e5_component(model_lower)) {
        return EmbeddingStrategy::CLS;
    }
    if (modelgate::contains(model_lower, "gpt")) {
        return EmbeddingStrategy::LAST_TOKEN;
    }
    return EmbeddingStrategy::MEAN_NO_SPECIAL;
}

std::string strategy_name(EmbeddingStrategy strategy) {
    switch (strategy) {
        case EmbeddingStrategy::CLS: return "cls";
        case EmbeddingStrategy::LAST_TOKEN: return "last_token";
        case EmbeddingStrategy::MEAN_NO_SPECIAL: return "mean_no_special";
    }
    return "mean_no_special";
}

} // namespace Embedding
