#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace snapkeep {

class InvalidUdevCommand : public std::runtime_error {
public:
    enum class Reason {
        InvalidChar,
        InvalidCmd,
        LimitExceeded
    };

    InvalidUdevCommand(Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

// Receives "run this command when that device appears" rules. Passed
// explicitly to whoever compiles schedules.
class UdevRuleSink {
public:
    virtual ~UdevRuleSink() = default;

    virtual bool isReady() const = 0;
    virtual void clean() = 0;
    // Throws InvalidUdevCommand if the rule would be rejected on install.
    virtual void addRule(const std::string& command, const std::string& uuid) = 0;
    virtual bool save() = 0;
};

// Keeps the rules of the current user in one rules file.
class UdevRuleFile : public UdevRuleSink {
public:
    static constexpr size_t MAX_RULES = 100;
    static constexpr size_t MAX_COMMAND_LENGTH = 2048;

    UdevRuleFile(std::string rulesPath, std::string executable, std::string user);

    static std::string defaultRulesPath(const std::string& user);
    static std::string renderRule(const std::string& command, const std::string& uuid, const std::string& user);

    bool isReady() const override;
    void clean() override;
    void addRule(const std::string& command, const std::string& uuid) override;
    bool save() override;

    const std::vector<std::string>& rules() const { return rules_; }
    const std::string& rulesPath() const { return rulesPath_; }

private:
    void validate(const std::string& command, const std::string& uuid) const;

    std::string rulesPath_;
    std::string executable_;
    std::string user_;
    std::vector<std::string> rules_;
    bool cleaned_{false};
};

} // namespace snapkeep
