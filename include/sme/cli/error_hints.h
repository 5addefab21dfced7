#pragma once

#include <sme/core/types.h>

#include <string>
#include <string_view>

namespace sme::cli {

/**
 * Actionable hints for CLI errors, chosen by message pattern first and error code second.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    ErrorHint hint;

    if (message.find("dimension") != std::string_view::npos ||
        message.find("metric") != std::string_view::npos) {
        hint.hint = "The index was created for a different model width or metric; use a new "
                    "index name or the matching models";
        return hint;
    }

    if (message.find("sparse model") != std::string_view::npos ||
        message.find("bm25") != std::string_view::npos) {
        hint.hint = "Run ingestion first to produce the sparse model artifact";
        hint.command = "sme-cli ingest";
        return hint;
    }

    if (message.find("Api-Key") != std::string_view::npos ||
        message.find("api key") != std::string_view::npos) {
        hint.hint = "Set the vector store key in the config file or SME_VECTOR_STORE_API_KEY";
        return hint;
    }

    switch (code) {
        case ErrorCode::ConfigurationError:
            hint.hint = "Check the configuration file and model names";
            hint.command = "sme-cli --help";
            break;

        case ErrorCode::MissingArtifact:
            hint.hint = "A required artifact is missing; run ingestion first";
            hint.command = "sme-cli ingest";
            break;

        case ErrorCode::FileNotFound:
            hint.hint = "Verify the file path exists and is accessible";
            break;

        case ErrorCode::PermissionDenied:
            hint.hint = "Check file/directory permissions and service credentials";
            break;

        case ErrorCode::NetworkError:
            hint.hint = "Check network connectivity and try again";
            break;

        case ErrorCode::Timeout:
        case ErrorCode::ServiceUnavailable:
            hint.hint = "The remote service is busy or down; try again later";
            break;

        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = command.empty() ? "sme-cli --help"
                                           : "sme-cli " + std::string(command) + " --help";
            break;

        case ErrorCode::CorruptedData:
            hint.hint = "An artifact is damaged; rerun ingestion to rebuild it";
            hint.command = "sme-cli ingest";
            break;

        default:
            break;
    }

    return hint;
}

inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    auto hint = getErrorHint(code, message, command);

    std::string result(message);
    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }
    return result;
}

} // namespace sme::cli
