#include "environmental_perception.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include "../common/file_utils.h"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace stepcoach {

bool Screenshot::saveToFile(const std::string& path) const {
    if (!isValid()) return false;

    try {
        std::filesystem::path target(path);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) return false;

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return file.good();

    } catch (const std::exception& e) {
        SLOG_ERROR().message("Failed to save screenshot")
            .context("path", path)
            .context("error", e.what());
        return false;
    }
}

bool Screenshot::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        SLOG_ERROR().message("Screenshot file does not exist")
            .context("path", path);
        return false;
    }

    const uintmax_t MAX_FILE_SIZE = 100 * 1024 * 1024;
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec || size > MAX_FILE_SIZE) {
        SLOG_ERROR().message("Screenshot file unreadable or too large")
            .context("path", path)
            .context("size", ec ? 0 : size);
        return false;
    }

    std::vector<uint8_t> bytes;
    if (!utils::FileUtils::readFileToBytes(path, bytes)) {
        return false;
    }

    data = std::move(bytes);
    filePath = path;
    std::string extension = utils::StringUtils::toLowerCase(std::filesystem::path(path).extension().string());
    if (!extension.empty()) {
        format = extension.substr(1);
    }
    return true;
}

std::string pageStatusToString(PageStatus status) {
    switch (status) {
        case PageStatus::NORMAL: return "normal";
        case PageStatus::LOADING: return "loading";
        case PageStatus::ERROR: return "error";
        case PageStatus::DIALOG: return "dialog";
        case PageStatus::LOGIN: return "login";
        case PageStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

PageStatus parsePageStatus(const std::string& status) {
    std::string lowered = utils::StringUtils::toLowerCase(utils::StringUtils::trim(status));
    if (lowered == "normal" || lowered == "正常") return PageStatus::NORMAL;
    if (lowered == "loading" || lowered == "加载中") return PageStatus::LOADING;
    if (lowered == "error" || lowered == "错误") return PageStatus::ERROR;
    if (lowered == "dialog" || lowered == "弹窗" || lowered == "对话框") return PageStatus::DIALOG;
    if (lowered == "login" || lowered == "登录") return PageStatus::LOGIN;
    return PageStatus::UNKNOWN;
}

ScreenState ScreenState::fromJson(const nlohmann::json& json) {
    using utils::JsonUtils;

    ScreenState state;
    state.appName = JsonUtils::getStringField(json, "app_name");
    state.screenState = JsonUtils::getStringField(json, "screen_state");
    if (state.screenState.empty()) {
        state.screenState = JsonUtils::getStringField(json, "screen_type");
    }
    state.pageStatus = parsePageStatus(JsonUtils::getStringField(json, "page_status", "normal"));
    state.description = JsonUtils::getStringField(json, "description");
    state.availableElements = JsonUtils::getStringArrayField(json, "available_elements");
    state.warnings = JsonUtils::getStringArrayField(json, "warnings");
    return state;
}

ScreenState ScreenState::unknown(const std::string& reason) {
    ScreenState state;
    state.pageStatus = PageStatus::UNKNOWN;
    state.description = reason;
    return state;
}

std::string ScreenState::toText() const {
    std::ostringstream text;
    text << "Application: " << (appName.empty() ? "unknown" : appName) << "\n";
    text << "Screen: " << (screenState.empty() ? "unknown" : screenState) << "\n";
    text << "Page status: " << pageStatusToString(pageStatus) << "\n";
    if (!description.empty()) {
        text << "Description: " << description << "\n";
    }
    if (!availableElements.empty()) {
        text << "Visible elements: " << utils::StringUtils::join(availableElements, ", ") << "\n";
    }
    if (!warnings.empty()) {
        text << "Warnings: " << utils::StringUtils::join(warnings, ", ") << "\n";
    }
    return text.str();
}

nlohmann::json ScreenState::toJson() const {
    return {
        {"app_name", appName},
        {"screen_state", screenState},
        {"page_status", pageStatusToString(pageStatus)},
        {"description", description},
        {"available_elements", availableElements},
        {"warnings", warnings}
    };
}

CommandSnapshotSource::CommandSnapshotSource(const std::string& captureCommand, const std::string& capturePath)
    : m_captureCommand(captureCommand)
    , m_capturePath(capturePath) {}

Result<Screenshot, OracleError> CommandSnapshotSource::grab() {
    SCOPED_TIMER("perception.grab");

    if (m_captureCommand.empty()) {
        _scoped_timer.markFailed();
        return Result<Screenshot, OracleError>::failure(
            OracleError(OracleError::Code::NOT_CONFIGURED, "No screen capture command configured"));
    }

    std::string command = utils::StringUtils::replaceAll(m_captureCommand, "{output}", m_capturePath);
    int exitCode = std::system(command.c_str());
    if (exitCode != 0) {
        _scoped_timer.markFailed();
        STEPCOACH_HANDLE_ERROR(ErrorType::PERCEPTION_ERROR, ErrorSeverity::MEDIUM,
                               "Screen capture command failed",
                               command + " exited with " + std::to_string(exitCode),
                               "CommandSnapshotSource::grab");
        return Result<Screenshot, OracleError>::failure(
            OracleError(OracleError::Code::TRANSPORT, "Screen capture command failed", 0, true));
    }

    Screenshot screenshot;
    if (!screenshot.loadFromFile(m_capturePath)) {
        _scoped_timer.markFailed();
        return Result<Screenshot, OracleError>::failure(
            OracleError(OracleError::Code::TRANSPORT, "Screen capture produced no image", 0, true));
    }
    return Result<Screenshot, OracleError>::success(std::move(screenshot));
}

FileSnapshotSource::FileSnapshotSource(const std::string& path)
    : m_path(path) {}

Result<Screenshot, OracleError> FileSnapshotSource::grab() {
    Screenshot screenshot;
    if (!screenshot.loadFromFile(m_path)) {
        return Result<Screenshot, OracleError>::failure(
            OracleError(OracleError::Code::TRANSPORT, "Cannot read screenshot file " + m_path));
    }
    return Result<Screenshot, OracleError>::success(std::move(screenshot));
}

OraclePerception::OraclePerception(std::shared_ptr<ISnapshotSource> source,
                                   std::shared_ptr<IOracle> oracle,
                                   std::shared_ptr<IClock> clock,
                                   const PromptLibrary& prompts)
    : m_source(std::move(source))
    , m_oracle(std::move(oracle))
    , m_clock(std::move(clock))
    , m_prompts(prompts) {

    if (!m_source || !m_oracle || !m_clock) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "OraclePerception requires a snapshot source, an oracle and a clock", "",
                        "OraclePerception::OraclePerception");
    }
}

Result<Snapshot, OracleError> OraclePerception::capture() {
    auto image = m_source->grab();
    if (!image.ok()) {
        return Result<Snapshot, OracleError>::failure(image.error());
    }

    Snapshot snapshot;
    snapshot.image = std::move(image).value();
    snapshot.capturedAt = m_clock->now();
    snapshot.state = analyze(snapshot.image);
    return Result<Snapshot, OracleError>::success(std::move(snapshot));
}

ScreenState OraclePerception::analyze(const Screenshot& image) {
    OracleRequest request;
    request.purpose = "screen";
    request.prompt = m_prompts.render("screen_analysis", {});
    request.images.push_back({image.data, image.format});
    request.maxTokens = 1000;

    auto answer = m_oracle->ask(request);
    if (!answer.ok()) {
        SLOG_WARNING().message("Screen analysis failed")
            .context("error", answer.error().message);
        return ScreenState::unknown("Screen analysis failed: " + answer.error().message);
    }

    auto document = utils::JsonUtils::extractJsonObject(answer.value());
    if (!document) {
        SLOG_WARNING().message("Screen analysis was not JSON")
            .context("answer", utils::StringUtils::truncateUtf8(answer.value(), 200));
        return ScreenState::unknown(utils::StringUtils::truncateUtf8(answer.value(), 500));
    }
    return ScreenState::fromJson(*document);
}

} // namespace stepcoach
