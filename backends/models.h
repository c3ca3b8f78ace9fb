#pragma once

#include <string>

/// @brief Model family classification for prompt format selection
/// Closed set: every switch over it is exhaustive, so adding a family is a
/// compile-checked change in the classifier and the template factory.
enum class ModelFamily {
    QWEN,       // Qwen / Qwen-VL - ChatML markup with <|im_start|>
    LLAMA_2,    // Llama 2 and unversioned llama fine-tunes - [INST] <<SYS>>
    LLAMA_3,    // Llama 3.x - <|begin_of_text|>, header ids, <|eot_id|>
    MISTRAL,    // Mistral / Mixtral - <s>[INST] ... [/INST]
    GEMMA,      // Google Gemma - <start_of_turn>user / model
    CHATML      // Everything else (phi, smollm, unknown) - plain ChatML
};

/// @brief Model identification helpers
/// All methods are pure functions of their arguments.
class Models {
public:
    /// @brief Classify a model identifier (HF repo id, directory name or path)
    /// Case-insensitive substring match in priority order qwen, llama, mistral/mixtral,
    /// gemma; anything else is CHATML. Never fails.
    static ModelFamily detect_family(const std::string& model_id);

    /// @brief True if a llama identifier names a Llama 3.x model ("llama-3" or "llama3")
    static bool is_llama3(const std::string& model_id);

    /// @brief Stable lowercase name of a family ("qwen", "llama2", "llama3", "mistral", "gemma", "chatml")
    static std::string family_name(ModelFamily family);

    /// @brief Placeholder token for the image at image_index (zero-based) within a message
    /// Qwen-VL models use numbered tokens (<image_1>, <image_2>, ...); everything else <image>.
    static std::string image_token(const std::string& model_id, size_t image_index);

    /// @brief Convert a cache directory name to its display form
    /// e.g. "mlx-community_Qwen2.5-0.5B" -> "mlx-community/Qwen2.5-0.5B".
    /// Only the separator after a known org prefix is converted.
    static std::string to_display_name(const std::string& local_name);

    /// @brief Convert a repo id to a cache directory name ("org/model" -> "org_model")
    static std::string to_local_name(const std::string& model_id);
};
