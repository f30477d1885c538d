#ifndef STEPCOACH_ENVIRONMENTAL_PERCEPTION_H
#define STEPCOACH_ENVIRONMENTAL_PERCEPTION_H

#include "../oracle/oracle.h"
#include "../common/clock.h"
#include "../common/result.h"
#include "../planner/prompt_library.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace stepcoach {

struct Screenshot {
    std::vector<uint8_t> data;
    std::string format;
    std::string filePath;

    Screenshot() : format("png") {}

    bool isValid() const { return !data.empty(); }
    bool saveToFile(const std::string& path) const;
    bool loadFromFile(const std::string& path);
};

enum class PageStatus {
    NORMAL,
    LOADING,
    ERROR,
    DIALOG,
    LOGIN,
    UNKNOWN
};

std::string pageStatusToString(PageStatus status);
PageStatus parsePageStatus(const std::string& status);

/**
 * @brief Textual analysis of one screen, as produced by the screen-analysis oracle
 */
struct ScreenState {
    std::string appName;
    std::string screenState;
    PageStatus pageStatus;
    std::string description;
    std::vector<std::string> availableElements;
    std::vector<std::string> warnings;

    ScreenState() : pageStatus(PageStatus::UNKNOWN) {}

    static ScreenState fromJson(const nlohmann::json& json);
    static ScreenState unknown(const std::string& reason);

    /**
     * @brief Multi-line description embedded into planner and judge prompts
     */
    std::string toText() const;
    nlohmann::json toJson() const;
};

struct Snapshot {
    Screenshot image;
    IClock::TimePoint capturedAt;
    ScreenState state;
};

/**
 * @brief Produces the raw screen image
 */
class ISnapshotSource {
public:
    virtual ~ISnapshotSource() = default;
    virtual Result<Screenshot, OracleError> grab() = 0;
};

/**
 * @brief Runs a shell capture command that writes an image to {output}
 */
class CommandSnapshotSource : public ISnapshotSource {
public:
    CommandSnapshotSource(const std::string& captureCommand, const std::string& capturePath);

    Result<Screenshot, OracleError> grab() override;

private:
    std::string m_captureCommand;
    std::string m_capturePath;
};

/**
 * @brief Re-reads an image file that something else keeps up to date
 */
class FileSnapshotSource : public ISnapshotSource {
public:
    explicit FileSnapshotSource(const std::string& path);

    Result<Screenshot, OracleError> grab() override;

private:
    std::string m_path;
};

class IPerception {
public:
    virtual ~IPerception() = default;
    virtual Result<Snapshot, OracleError> capture() = 0;
};

/**
 * @brief Snapshot source plus one screen-analysis oracle call per capture
 *
 * A failed or unparseable analysis yields a snapshot whose page status is
 * UNKNOWN; only a failed image grab is reported as an error.
 */
class OraclePerception : public IPerception {
public:
    OraclePerception(std::shared_ptr<ISnapshotSource> source,
                     std::shared_ptr<IOracle> oracle,
                     std::shared_ptr<IClock> clock,
                     const PromptLibrary& prompts = PromptLibrary());

    Result<Snapshot, OracleError> capture() override;

private:
    std::shared_ptr<ISnapshotSource> m_source;
    std::shared_ptr<IOracle> m_oracle;
    std::shared_ptr<IClock> m_clock;
    PromptLibrary m_prompts;

    ScreenState analyze(const Screenshot& image);
};

} // namespace stepcoach

#endif // STEPCOACH_ENVIRONMENTAL_PERCEPTION_H
