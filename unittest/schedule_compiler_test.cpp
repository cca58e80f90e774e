#include <gtest/gtest.h>
#include "schedule/schedule_compiler.hpp"
#include "schedule/cron_command.hpp"
#include "schedule/crontab.hpp"
#include "config/profile_settings.hpp"
#include "common/error_notifier.hpp"
#include "test_utils.hpp"

using namespace snapkeep;
using namespace snapkeep::testing_utils;

namespace {

ScheduleSpec specFor(ScheduleMode mode) {
    ScheduleSpec spec;
    spec.mode = mode;
    return spec;
}

class InMemoryCrontab : public Crontab {
public:
    std::optional<std::vector<std::string>> read() const override { return lines; }
    bool write(const std::vector<std::string>& newLines) const override {
        ++writes;
        lines = newLines;
        return true;
    }
    bool isDaemonRunning() const override { return daemonRunning; }

    mutable std::vector<std::string> lines;
    mutable int writes = 0;
    bool daemonRunning = true;
};

} // namespace

class ScheduleCompilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        paths_.configPath = "/home/user/.config/snapkeep/config.json";
        paths_.defaultConfigPath = paths_.configPath;
        paths_.dataDir = "/home/user/.local/share/snapkeep";
        settings_ = std::make_unique<ProfileSettings>(store_, paths_);
        commands_ = std::make_unique<CronCommandBuilder>(*settings_, [](const std::string& name) {
            return fakeLocator(name, {"snapkeep"});
        });
        compiler_ = std::make_unique<ScheduleCompiler>(*settings_, resolver_, udev_, notifier_, *commands_);
    }

    void configureDeviceProfile(const std::string& profileId) {
        ScheduleSpec spec = specFor(ScheduleMode::OnDeviceConnect);
        settings_->setScheduleSpec(spec, profileId);
        store_.setProfileStrValue("snapshots.path", "/media/usb", profileId);
    }

    ConfigStore store_;
    ConfigPaths paths_;
    std::unique_ptr<ProfileSettings> settings_;
    FakeDeviceResolver resolver_;
    RecordingUdevSink udev_;
    LoggingNotifier notifier_;
    std::unique_ptr<CronCommandBuilder> commands_;
    std::unique_ptr<ScheduleCompiler> compiler_;
};

TEST_F(ScheduleCompilerTest, DailyUsesMinuteAndHourOfTime) {
    ScheduleSpec spec = specFor(ScheduleMode::Daily);
    spec.time = 1345;

    CompiledSchedule schedule = ScheduleCompiler::compile(spec);
    ASSERT_TRUE(schedule.isCron());
    EXPECT_EQ(schedule.minute, "45");
    EXPECT_EQ(schedule.hour, "13");
    EXPECT_EQ(schedule.dayOfMonth, "*");
    EXPECT_EQ(schedule.month, "*");
    EXPECT_EQ(schedule.dayOfWeek, "*");
}

TEST_F(ScheduleCompilerTest, WeeklyAtMidnightOnSunday) {
    ScheduleSpec spec = specFor(ScheduleMode::Weekly);
    spec.time = 0;
    spec.weekday = 7;

    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "0 0 * * 7");
}

TEST_F(ScheduleCompilerTest, FixedIntervals) {
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every5Min)).timeSpec(), "*/5 * * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every10Min)).timeSpec(), "*/10 * * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every30Min)).timeSpec(), "*/30 * * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Hourly)).timeSpec(), "0 * * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every2H)).timeSpec(), "0 */2 * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every4H)).timeSpec(), "0 */4 * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every6H)).timeSpec(), "0 */6 * * *");
    EXPECT_EQ(ScheduleCompiler::compile(specFor(ScheduleMode::Every12H)).timeSpec(), "0 */12 * * *");
}

TEST_F(ScheduleCompilerTest, CalendarModes) {
    ScheduleSpec spec = specFor(ScheduleMode::Monthly);
    spec.time = 2230;
    spec.day = 15;
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "30 22 15 * *");

    spec.mode = ScheduleMode::Yearly;
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "30 22 1 1 *");

    spec.mode = ScheduleMode::CustomHours;
    spec.customHours = "6,18";
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "0 6,18 * * *");
}

TEST_F(ScheduleCompilerTest, RepeatedIntervalPollsByUnit) {
    ScheduleSpec spec = specFor(ScheduleMode::RepeatedInterval);
    spec.repeatedUnit = TimeUnit::Hour;
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "*/15 * * * *");
    spec.repeatedUnit = TimeUnit::Day;
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "*/15 * * * *");
    spec.repeatedUnit = TimeUnit::Week;
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "0 * * * *");
    spec.repeatedUnit = TimeUnit::Month;
    EXPECT_EQ(ScheduleCompiler::compile(spec).timeSpec(), "0 * * * *");
}

TEST_F(ScheduleCompilerTest, SpecialAndEmptyForms) {
    CompiledSchedule boot = ScheduleCompiler::compile(specFor(ScheduleMode::AtBoot));
    EXPECT_EQ(boot.toCronLine("cmd"), "@reboot cmd");

    CompiledSchedule disabled = ScheduleCompiler::compile(specFor(ScheduleMode::Disabled));
    EXPECT_TRUE(disabled.isEmpty());
    EXPECT_EQ(disabled.toCronLine("cmd"), "");

    EXPECT_TRUE(ScheduleCompiler::compile(specFor(scheduleModeFromInt(3))).isEmpty());
}

TEST_F(ScheduleCompilerTest, PercentSignIsEscapedInCronLine) {
    CompiledSchedule boot = ScheduleCompiler::compile(specFor(ScheduleMode::AtBoot));
    EXPECT_EQ(boot.toCronLine("cmd --config '/a b/50%'"), "@reboot cmd --config '/a b/50\\%'");

    paths_.configPath = "/home/user/100%/config.json";
    settings_ = std::make_unique<ProfileSettings>(store_, paths_);
    commands_ = std::make_unique<CronCommandBuilder>(*settings_, [](const std::string& name) {
        return fakeLocator(name, {"snapkeep"});
    });
    compiler_ = std::make_unique<ScheduleCompiler>(*settings_, resolver_, udev_, notifier_, *commands_);
    settings_->setScheduleSpec(specFor(ScheduleMode::Hourly), "1");

    auto lines = compiler_->compileAll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "0 * * * * /usr/bin/snapkeep --config /home/user/100\\%/config.json backup-job >/dev/null");
}

// Same input, same output, whatever was compiled before.
TEST_F(ScheduleCompilerTest, CompileIsPure) {
    ScheduleSpec daily = specFor(ScheduleMode::Daily);
    daily.time = 705;
    std::string first = ScheduleCompiler::compile(daily).timeSpec();
    ScheduleCompiler::compile(specFor(ScheduleMode::Every2H));
    ScheduleCompiler::compile(specFor(ScheduleMode::AtBoot));
    EXPECT_EQ(ScheduleCompiler::compile(daily).timeSpec(), first);
    EXPECT_EQ(first, "5 7 * * *");
}

TEST_F(ScheduleCompilerTest, CompileAllSkipsUnscheduledProfiles) {
    store_.setListValue("profiles", nlohmann::json::array({"1", "2", "3"}));
    ScheduleSpec hourly = specFor(ScheduleMode::Hourly);
    settings_->setScheduleSpec(hourly, "1");
    settings_->setScheduleSpec(specFor(ScheduleMode::Disabled), "2");
    settings_->setScheduleSpec(specFor(ScheduleMode::AtBoot), "3");

    auto lines = compiler_->compileAll();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "0 * * * * /usr/bin/snapkeep backup-job >/dev/null");
    EXPECT_EQ(lines[1], "@reboot /usr/bin/snapkeep --profile-id 3 backup-job >/dev/null");
    EXPECT_FALSE(notifier_.hasErrors());
}

TEST_F(ScheduleCompilerTest, DeviceTriggerRegistersUdevRuleAndCachesUuid) {
    configureDeviceProfile("1");
    resolver_.uuid = "1234-ABCD";

    CompiledSchedule schedule = compiler_->compileProfile("1");
    ASSERT_TRUE(schedule.isDevice());
    EXPECT_EQ(schedule.uuid, "1234-ABCD");
    ASSERT_EQ(udev_.rules.size(), 1u);
    EXPECT_EQ(udev_.rules[0].first, "/usr/bin/snapkeep backup-job >/dev/null");
    EXPECT_EQ(udev_.rules[0].second, "1234-ABCD");
    EXPECT_EQ(settings_->cachedDeviceUuid("1"), "1234-ABCD");
    ASSERT_EQ(resolver_.lookups.size(), 1u);
    EXPECT_EQ(resolver_.lookups[0].compare(0, 20, "/media/usb/snapkeep/"), 0);

    // Device triggered profiles have no crontab line.
    EXPECT_TRUE(compiler_->compileAll().empty());
}

TEST_F(ScheduleCompilerTest, DeviceTriggerFallsBackToCachedUuid) {
    configureDeviceProfile("1");
    settings_->setCachedDeviceUuid("CACHED-1", "1");

    CompiledSchedule schedule = compiler_->compileProfile("1");
    ASSERT_TRUE(schedule.isDevice());
    EXPECT_EQ(schedule.uuid, "CACHED-1");
    ASSERT_EQ(udev_.rules.size(), 1u);
    EXPECT_EQ(udev_.rules[0].second, "CACHED-1");
    EXPECT_FALSE(notifier_.hasErrors());
}

TEST_F(ScheduleCompilerTest, DeviceTriggerWithoutAnyUuidIsSkipped) {
    configureDeviceProfile("1");

    EXPECT_TRUE(compiler_->compileProfile("1").isEmpty());
    EXPECT_TRUE(udev_.rules.empty());
    ASSERT_EQ(notifier_.getMessages().size(), 1u);
    EXPECT_NE(notifier_.getMessages()[0].find("Couldn't find UUID"), std::string::npos);
}

TEST_F(ScheduleCompilerTest, DeviceTriggerRejectsRemoteModes) {
    configureDeviceProfile("1");
    store_.setProfileStrValue("snapshots.mode", "ssh", "1");
    resolver_.uuid = "1234-ABCD";

    EXPECT_TRUE(compiler_->compileProfile("1").isEmpty());
    EXPECT_TRUE(resolver_.lookups.empty());
    ASSERT_TRUE(notifier_.hasErrors());
    EXPECT_NE(notifier_.getMessages()[0].find("doesn't work with mode ssh"), std::string::npos);
}

TEST_F(ScheduleCompilerTest, DeviceTriggerUsesEncfsPath) {
    configureDeviceProfile("1");
    store_.setProfileStrValue("snapshots.mode", "local_encfs", "1");
    store_.setProfileStrValue("snapshots.local_encfs.path", "/media/crypt", "1");
    resolver_.uuid = "1234-ABCD";

    EXPECT_TRUE(compiler_->compileProfile("1").isDevice());
    ASSERT_EQ(resolver_.lookups.size(), 1u);
    EXPECT_EQ(resolver_.lookups[0], "/media/crypt");
}

TEST_F(ScheduleCompilerTest, RejectedUdevRuleOnlySkipsThatProfile) {
    store_.setListValue("profiles", nlohmann::json::array({"1", "2"}));
    configureDeviceProfile("1");
    settings_->setScheduleSpec(specFor(ScheduleMode::Hourly), "2");
    resolver_.uuid = "1234-ABCD";
    udev_.rejectWith = InvalidUdevCommand::Reason::InvalidChar;

    auto lines = compiler_->compileAll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("--profile-id 2"), std::string::npos);
    ASSERT_EQ(notifier_.getMessages().size(), 1u);
    EXPECT_NE(notifier_.getMessages()[0].find("rejected"), std::string::npos);
}

TEST_F(ScheduleCompilerTest, SetupSchedulesReplacesManagedCrontabEntries) {
    settings_->setScheduleSpec(specFor(ScheduleMode::Hourly), "1");
    InMemoryCrontab crontab;
    crontab.lines = {"MAILTO=me", Crontab::MARKER, "*/5 * * * * /old/snapkeep backup-job", "@daily /usr/bin/other"};

    EXPECT_TRUE(compiler_->setupSchedules(crontab));
    EXPECT_EQ(udev_.cleanCalls, 1);
    EXPECT_EQ(udev_.saveCalls, 1);
    ASSERT_EQ(crontab.lines.size(), 4u);
    EXPECT_EQ(crontab.lines[0], "MAILTO=me");
    EXPECT_EQ(crontab.lines[1], "@daily /usr/bin/other");
    EXPECT_EQ(crontab.lines[2], Crontab::MARKER);
    EXPECT_EQ(crontab.lines[3], "0 * * * * /usr/bin/snapkeep backup-job >/dev/null");

    // Second run finds nothing to change.
    EXPECT_TRUE(compiler_->setupSchedules(crontab));
    EXPECT_EQ(crontab.writes, 1);
}

TEST_F(ScheduleCompilerTest, SetupSchedulesWarnsWhenCronIsNotRunning) {
    settings_->setScheduleSpec(specFor(ScheduleMode::Hourly), "1");
    InMemoryCrontab crontab;
    crontab.daemonRunning = false;

    EXPECT_TRUE(compiler_->setupSchedules(crontab));
    EXPECT_EQ(crontab.writes, 1);
    ASSERT_EQ(notifier_.getMessages().size(), 1u);
    EXPECT_NE(notifier_.getMessages()[0].find("Cron is not running"), std::string::npos);

    // Only a fresh write is checked.
    notifier_.clear();
    EXPECT_TRUE(compiler_->setupSchedules(crontab));
    EXPECT_FALSE(notifier_.hasErrors());
}

TEST_F(ScheduleCompilerTest, SetupSchedulesReportsUdevSaveFailure) {
    udev_.saveResult = false;
    InMemoryCrontab crontab;

    EXPECT_FALSE(compiler_->setupSchedules(crontab));
    EXPECT_TRUE(notifier_.hasErrors());
}
