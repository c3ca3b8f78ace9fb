#pragma once

#include <string>

/// @brief How token vectors are pooled into one embedding
enum class EmbeddingStrategy {
    CLS,                // First ([CLS]) token - BERT and E5 encoders
    LAST_TOKEN,         // Final token - decoder-only GPT-style models
    MEAN_NO_SPECIAL     // Mean over non-special tokens - everything else
};

namespace Embedding {

/// @brief Pick the pooling strategy for the active model
/// Case-insensitive: "bert" or an "e5" name component -> CLS, "gpt" -> LAST_TOKEN,
/// otherwise MEAN_NO_SPECIAL.
EmbeddingStrategy select_strategy(const std::string& model_id);

/// @brief Stable name of a strategy ("cls", "last_token", "mean_no_special")
std::string strategy_name(EmbeddingStrategy strategy);

} // namespace Embedding
