#ifndef SYSTEM_PROMPT_H
#define SYSTEM_PROMPT_H

// Preamble of every rendered system block unless config.json sets "system_prompt"
constexpr const char* SYSTEM_PROMPT = "You are a helpful assistant.";

#endif
