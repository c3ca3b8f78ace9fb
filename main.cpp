#include "modelgate.h"
#include "config.h"
#include "message.h"
#include "completion.h"
#include "tools/tool.h"
#include "tools/tool_parser.h"
#include "backends/models.h"
#include "backends/chat_template.h"
#include "backends/model_metadata.h"
#include "backends/embedding.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstdio>
#include <getopt.h>

using json = nlohmann::json;

static void print_usage(int, char** argv) {
	printf("\n=== modelgate - model adapter core ===\n");
	printf("\nUsage:\n");
	printf("	%s [OPTIONS] <command> [args]\n", argv[0]);
	printf("\nCommands:\n");
	printf("	render <request.json|->    Render a chat request into the model's prompt\n");
	printf("	extract <file|->           Extract tool calls from generated text (prints completion JSON)\n");
	printf("	params <size>              Parse a parameter count (\"7b\", \"135 million\", ...)\n");
	printf("	family <model>             Show the prompt family of a model id\n");
	printf("	embedding <model>          Show the embedding pooling strategy of a model id\n");
	printf("\nOptions:\n");
	printf("	-c, --config FILE  Specify config file (default: ~/.config/modelgate/config.json)\n");
	printf("	-d, --debug[=LEVEL] Enable debug logging (trace, debug; default: debug)\n");
	printf("	-l, --log-file     Also log to file\n");
	printf("	-m, --model        Model id for render (overrides request and config)\n");
	printf("	-v, --version      Show version information\n");
	printf("	-h, --help         Show this help message\n");
	printf("\nRequest format (render):\n");
	printf("	{\"model\": \"...\", \"messages\": [...], \"tools\": [...], \"system_prompt\": \"...\"}\n");
	printf("\nConfiguration:\n");
	printf("	Edit ~/.config/modelgate/config.json to configure:\n");
	printf("	- system_prompt: preamble of every rendered system block\n");
	printf("	- log_level: trace, debug, info, warn, error, fatal\n");
	printf("	- log_file: path of an additional log file\n");
	printf("	- model: default model id\n");
	printf("\n");
}

// Read a whole file, or stdin for "-"
static std::string read_input(const std::string& path) {
	std::stringstream buffer;
	if (path == "-") {
		buffer << std::cin.rdbuf();
		return buffer.str();
	}

	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Cannot read " + path);
	}
	buffer << file.rdbuf();
	return buffer.str();
}

static int handle_render(const std::string& path, const std::string& model_override, const Config& config) {
	json request;
	try {
		request = json::parse(read_input(path));
	} catch (const json::parse_error& e) {
		throw std::runtime_error("Invalid request JSON in " + path + ": " + e.what());
	}
	if (!request.is_object()) {
		throw std::runtime_error("Request must be a JSON object");
	}

	std::string model = config.model;
	if (request.contains("model") && request["model"].is_string()) {
		model = request["model"].get<std::string>();
	}
	if (!model_override.empty()) {
		model = model_override;
	}

	std::string system_prompt = config.system_prompt;
	if (request.contains("system_prompt") && request["system_prompt"].is_string()) {
		system_prompt = request["system_prompt"].get<std::string>();
	}

	std::vector<ChatMessage> messages;
	std::vector<ToolDefinition> tools;
	try {
		messages = messages_from_json(request.value("messages", json::array()));
		if (request.contains("tools") && !request["tools"].is_null()) {
			tools = tool_utils::tools_from_json(request["tools"]);
		}
	} catch (const std::invalid_argument& e) {
		throw std::runtime_error(std::string("Invalid request: ") + e.what());
	}

	LOG_INFO("Rendering " + std::to_string(messages.size()) + " messages for model '" + model +
	         "' (" + Models::family_name(Models::detect_family(model)) + ")");

	std::cout << ChatTemplates::render_prompt(messages, tools, model, system_prompt);
	std::cout.flush();
	return 0;
}

static int handle_extract(const std::string& path) {
	CompletionResponse response = CompletionResponse::from_generation(read_input(path));
	std::cout << response.to_json().dump(2) << std::endl;
	return 0;
}

int main(int argc, char** argv) {
	std::string config_file_path;
	std::string log_file;
	std::string model_override;
	std::string debug_level;
	bool debug = false;

	static struct option long_options[] = {
		{"config", required_argument, 0, 'c'},
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"model", required_argument, 0, 'm'},
		{"version", no_argument, 0, 'v'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	while ((opt = getopt_long(argc, argv, "c:d::l:m:vh", long_options, &option_index)) != -1) {
		switch (opt) {
			case 'c':
				config_file_path = optarg;
				break;
			case 'd':
				debug = true;
				debug_level = optarg ? optarg : "debug";
				break;
			case 'l':
				log_file = optarg;
				break;
			case 'm':
				model_override = optarg;
				break;
			case 'v':
				printf("modelgate version %s\n", MODELGATE_VERSION);
				return 0;
			case 'h':
				print_usage(argc, argv);
				return 0;
			default:
				print_usage(argc, argv);
				return 1;
		}
	}

	if (optind >= argc) {
		print_usage(argc, argv);
		return 1;
	}

	std::string command = argv[optind];
	std::vector<std::string> args(argv + optind + 1, argv + argc);

	Logger& logger = Logger::instance();

	Config config;
	try {
		if (!config_file_path.empty()) {
			config.set_config_path(config_file_path);
		}
		config.load();
		config.validate();
	} catch (const ConfigError& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	}

	LogLevel level = LogLevel::INFO;
	if (!Logger::parse_level(config.log_level, level)) {
		level = LogLevel::INFO;
	}
	if (debug) {
		if (!Logger::parse_level(debug_level, level)) {
			fprintf(stderr, "Error: unknown debug level '%s'\n", debug_level.c_str());
			return 1;
		}
	}
	logger.set_log_level(level);

	if (log_file.empty()) {
		log_file = config.log_file;
	}
	if (!log_file.empty() && !logger.set_log_file(log_file)) {
		return 1;
	}

	LOG_DEBUG("modelgate " + std::string(MODELGATE_VERSION) + " command: " + command);

	try {
		if (command == "render") {
			if (args.size() != 1) {
				fprintf(stderr, "Usage: %s render <request.json|->\n", argv[0]);
				return 1;
			}
			return handle_render(args[0], model_override, config);
		}

		if (command == "extract") {
			if (args.size() != 1) {
				fprintf(stderr, "Usage: %s extract <file|->\n", argv[0]);
				return 1;
			}
			return handle_extract(args[0]);
		}

		if (command == "params") {
			if (args.empty()) {
				fprintf(stderr, "Usage: %s params <size>\n", argv[0]);
				return 1;
			}
			// Allow "7 billion" unquoted
			std::string size = args[0];
			for (size_t i = 1; i < args.size(); i++) {
				size += " " + args[i];
			}
			printf("%lld\n", static_cast<long long>(ModelMetadata::parse_parameter_count(size)));
			return 0;
		}

		if (command == "family" || command == "embedding") {
			std::string model = args.empty() ? model_override : args[0];
			if (model.empty()) model = config.model;
			if (model.empty()) {
				fprintf(stderr, "Usage: %s %s <model>\n", argv[0], command.c_str());
				return 1;
			}
			if (command == "family") {
				printf("%s\n", Models::family_name(Models::detect_family(model)).c_str());
			} else {
				printf("%s\n", Embedding::strategy_name(Embedding::select_strategy(model)).c_str());
			}
			return 0;
		}
	} catch (const std::runtime_error& e) {
		LOG_ERROR(e.what());
		fprintf(stderr, "Error: %s\n", e.what());
		return 1;
	}

	fprintf(stderr, "Unknown command: %s\n", command.c_str());
	print_usage(argc, argv);
	return 1;
}
