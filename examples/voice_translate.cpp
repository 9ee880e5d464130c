#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "core/voice_service.hpp"
#include "transport/voice_client.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace voicestream;

namespace {

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <audio-file | ->\n"
              << "Options:\n"
              << "  --config <path>          Configuration file (default: config/voicestream.json)\n"
              << "  --to <langs>             Comma-separated target languages (max 5)\n"
              << "  --from <lang>            Source language (default: auto-detect)\n"
              << "  --content-type <type>    Audio content type (required for stdin)\n"
              << "  --formality <level>      Formality of the translations\n"
              << "  --glossary <id>          Glossary to apply\n"
              << "  --chunk-size <bytes>     Audio chunk size\n"
              << "  --chunk-interval <ms>    Pause between chunks\n"
              << "  --no-reconnect           Fail on the first connection loss\n"
              << "  --max-reconnect <n>      Reconnect attempts (default: 3)\n"
              << "  --verbose                Debug logging\n"
              << "  --help, -h               Show this help message\n"
              << "Use '-' to read audio from stdin.\n";
}

void printTranscript(const std::string& label, const core::Transcript& transcript) {
    std::cout << "[" << label << " " << transcript.language << "] " << transcript.text << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/voicestream.json";
    std::string input;
    std::string targets;
    std::string sourceLanguage;
    std::string contentType;
    std::string formality;
    std::string glossary;
    std::string chunkSize;
    std::string chunkInterval;
    std::string maxReconnect;
    bool noReconnect = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--to" && i + 1 < argc) {
            targets = argv[++i];
        } else if (arg == "--from" && i + 1 < argc) {
            sourceLanguage = argv[++i];
        } else if (arg == "--content-type" && i + 1 < argc) {
            contentType = argv[++i];
        } else if (arg == "--formality" && i + 1 < argc) {
            formality = argv[++i];
        } else if (arg == "--glossary" && i + 1 < argc) {
            glossary = argv[++i];
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            chunkSize = argv[++i];
        } else if (arg == "--chunk-interval" && i + 1 < argc) {
            chunkInterval = argv[++i];
        } else if (arg == "--max-reconnect" && i + 1 < argc) {
            maxReconnect = argv[++i];
        } else if (arg == "--no-reconnect") {
            noReconnect = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (input.empty() && (arg == "-" || arg.rfind("--", 0) != 0)) {
            input = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 6;
        }
    }

    if (input.empty()) {
        printUsage(argv[0]);
        return 6;
    }

    try {
        utils::VoiceConfigManager configManager;
        configManager.loadFromFile(configPath);
        configManager.applyEnvironment();
        utils::VoiceConfig config = configManager.getConfig();

        utils::Logger::Level level = utils::Logger::Level::INFO;
        if (!utils::Logger::parseLevel(config.logLevel, level)) {
            std::cerr << "Unknown log level '" << config.logLevel << "', using INFO" << std::endl;
        }
        utils::Logger::initialize(verbose ? utils::Logger::Level::DEBUG : level);

        core::StreamOptions options = core::VoiceService::optionsFromConfig(config);
        if (!targets.empty()) options.targetLanguages = splitList(targets);
        if (!sourceLanguage.empty()) options.sourceLanguage = sourceLanguage;
        if (!contentType.empty()) options.contentType = contentType;
        if (!formality.empty()) options.formality = formality;
        if (!glossary.empty()) options.glossaryId = glossary;
        if (!chunkSize.empty()) options.chunkSize = std::stoul(chunkSize);
        if (!chunkInterval.empty()) options.chunkInterval = std::chrono::milliseconds(std::stoi(chunkInterval));
        if (!maxReconnect.empty()) options.maxReconnectAttempts = std::stoi(maxReconnect);
        if (noReconnect) options.reconnect = false;

        transport::VoiceClientOptions clientOptions;
        clientOptions.apiKey = config.apiKey;
        clientOptions.baseUrl = config.baseUrl;
        clientOptions.allowedDomain = config.streamingDomain;
        clientOptions.highWaterMarkBytes = config.sendHighWaterMarkBytes;
        clientOptions.timeoutMs = config.requestTimeoutMs;
        clientOptions.maxRetries = config.maxRetries;

        core::VoiceService service(transport::VoiceClient::create(clientOptions));

        core::StreamCallbacks callbacks;
        callbacks.onSourceTranscript = [](const transport::TranscriptUpdate& update) {
            for (const auto& segment : update.concluded) {
                std::cerr << "  source: " << segment.text << std::endl;
            }
        };
        callbacks.onReconnecting = [](int attempt) {
            std::cerr << "Connection lost, reconnecting (attempt " << attempt << ")..." << std::endl;
        };

        // Ctrl+C asks the server to finish instead of killing the stream
        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT);
        signals.async_wait([&service](const boost::system::error_code& ec, int) {
            if (!ec) {
                std::cerr << "Finishing, waiting for final transcripts..." << std::endl;
                service.cancel();
            }
        });
        std::thread signalThread([&signalContext]() { signalContext.run(); });

        core::SessionResult result;
        try {
            result = (input == "-") ? service.translateStream(std::cin, options, callbacks)
                                    : service.translateFile(input, options, callbacks);
        } catch (...) {
            signalContext.stop();
            signalThread.join();
            throw;
        }
        signalContext.stop();
        signalThread.join();

        std::cout << "Session " << result.sessionId << std::endl;
        printTranscript("source", result.source);
        for (const auto& target : result.targets) {
            printTranscript("target", target);
        }
        return 0;

    } catch (const utils::VoiceStreamException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (!e.getSuggestion().empty()) {
            std::cerr << e.getSuggestion() << std::endl;
        }
        return e.getExitCode();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
