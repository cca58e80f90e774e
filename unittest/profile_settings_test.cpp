#include <gtest/gtest.h>
#include "config/profile_settings.hpp"
#include "common/error_notifier.hpp"

using namespace snapkeep;

class ProfileSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        paths_.configPath = "/home/me/.config/snapkeep/config.json";
        paths_.defaultConfigPath = paths_.configPath;
        paths_.dataDir = "/home/me/.local/share/snapkeep";
        settings_ = std::make_unique<ProfileSettings>(store_, paths_);
    }

    void configure(const std::string& profileId) {
        store_.setProfileStrValue("snapshots.path", "/backup", profileId);
        settings_->setInclude({{"/home/me", 0}}, profileId);
    }

    ConfigStore store_;
    ConfigPaths paths_;
    std::unique_ptr<ProfileSettings> settings_;
};

TEST_F(ProfileSettingsTest, ScheduleDefaults) {
    ScheduleSpec spec = settings_->scheduleSpec("1");
    EXPECT_EQ(spec.mode, ScheduleMode::Disabled);
    EXPECT_EQ(spec.time, 0);
    EXPECT_EQ(spec.day, 1);
    EXPECT_EQ(spec.weekday, 7);
    EXPECT_EQ(spec.customHours, "8,12,18,23");
    EXPECT_EQ(spec.repeatedPeriod, 1);
    EXPECT_EQ(spec.repeatedUnit, TimeUnit::Day);
}

TEST_F(ProfileSettingsTest, ScheduleSpecIsPerProfile) {
    ScheduleSpec spec;
    spec.mode = ScheduleMode::Weekly;
    spec.time = 2015;
    spec.weekday = 3;
    settings_->setScheduleSpec(spec, "2");

    EXPECT_EQ(settings_->scheduleMode("2"), ScheduleMode::Weekly);
    EXPECT_EQ(settings_->scheduleSpec("2").hour(), 20);
    EXPECT_EQ(settings_->scheduleSpec("2").minute(), 15);
    EXPECT_EQ(settings_->scheduleMode("1"), ScheduleMode::Disabled);
}

TEST_F(ProfileSettingsTest, RetentionDefaults) {
    RetentionSpec retention = settings_->retention("1");
    EXPECT_TRUE(retention.age.enabled);
    EXPECT_EQ(retention.age.value, 10);
    EXPECT_EQ(retention.age.unit, TimeUnit::Year);
    EXPECT_EQ(retention.space.unit, DiskUnit::GB);
    EXPECT_EQ(retention.inodes.percent, 2);
    EXPECT_FALSE(retention.smart.enabled);
    EXPECT_EQ(retention.smart.keepOnePerMonthMonths, 24);
}

TEST_F(ProfileSettingsTest, SshMaxArgLengthRejectsTooSmallValues) {
    EXPECT_EQ(settings_->sshMaxArgLength("1"), 0);
    store_.setProfileIntValue("snapshots.ssh.max_arg_length", 700, "1");
    EXPECT_EQ(settings_->sshMaxArgLength("1"), 700);
    store_.setProfileIntValue("snapshots.ssh.max_arg_length", 699, "1");
    EXPECT_THROW(settings_->sshMaxArgLength("1"), std::invalid_argument);
}

TEST_F(ProfileSettingsTest, SshPrefixRenderings) {
    EXPECT_TRUE(settings_->sshPrefixTokens("1").empty());
    EXPECT_EQ(settings_->sshPrefixShellString("1"), "");

    store_.setProfileBoolValue("snapshots.ssh.prefix.enabled", true, "1");
    EXPECT_EQ(settings_->sshPrefixTokens("1"), (std::vector<std::string>{"PATH=/opt/bin:/opt/sbin:$PATH"}));
    EXPECT_EQ(settings_->sshPrefixShellString("1"), "PATH=/opt/bin:/opt/sbin:\\$PATH ");

    store_.setProfileStrValue("snapshots.ssh.prefix.value", "  nice -n 5 ", "1");
    EXPECT_EQ(settings_->sshPrefixTokens("1"), (std::vector<std::string>{"nice", "-n", "5"}));
    EXPECT_EQ(settings_->sshPrefixShellString("1"), "nice -n 5 ");
}

TEST_F(ProfileSettingsTest, DerivedPaths) {
    store_.setListValue("profiles", nlohmann::json::array({"1", "2"}));
    store_.setProfileStrValue("name", "Work laptop", "2");

    EXPECT_EQ(settings_->fileId("1"), "");
    EXPECT_EQ(settings_->fileId("2"), "2");
    EXPECT_EQ(settings_->anacronSpoolFile("2"), "/home/me/.local/share/snapkeep/anacron/2_Work_laptop");
    EXPECT_EQ(settings_->takeSnapshotInstanceFile("1"), "/home/me/.local/share/snapkeep/worker.lock");
    EXPECT_EQ(settings_->takeSnapshotInstanceFile("2"), "/home/me/.local/share/snapkeep/worker2.lock");

    store_.setProfileStrValue("snapshots.path", "/backup", "1");
    store_.setProfileStrValue("snapshots.path.host", "box", "1");
    store_.setProfileStrValue("snapshots.path.user", "me", "1");
    EXPECT_EQ(settings_->snapshotsFullPath("1"), "/backup/snapkeep/box/me/1");
}

TEST_F(ProfileSettingsTest, ExcludeFallsBackToDefaults) {
    EXPECT_EQ(settings_->exclude("1"), ProfileSettings::defaultExclude());
    settings_->setExclude({}, "1");
    EXPECT_TRUE(settings_->exclude("1").empty());
}

TEST_F(ProfileSettingsTest, StderrRedirectDefaultsToConfiguredState) {
    EXPECT_TRUE(settings_->redirectStdoutInCron("1"));
    EXPECT_FALSE(settings_->redirectStderrInCron("1"));
    configure("1");
    EXPECT_TRUE(settings_->redirectStderrInCron("1"));
}

TEST_F(ProfileSettingsTest, CheckConfigReportsFirstProblem) {
    LoggingNotifier notifier;
    EXPECT_FALSE(settings_->checkConfig(notifier));
    ASSERT_EQ(notifier.getMessages().size(), 1u);
    EXPECT_NE(notifier.getMessages()[0].find("Snapshots folder is not valid"), std::string::npos);

    notifier.clear();
    configure("1");
    EXPECT_TRUE(settings_->checkConfig(notifier));
    EXPECT_FALSE(notifier.hasErrors());

    settings_->setInclude({{"/backup/data", 0}}, "1");
    EXPECT_FALSE(settings_->checkConfig(notifier));
    EXPECT_NE(notifier.getMessages()[0].find("Backup sub-folder cannot be included"), std::string::npos);
}

TEST_F(ProfileSettingsTest, ConfigPathOverride) {
    ConfigPaths paths = ConfigPaths::defaults("/etc/snapkeep.json");
    EXPECT_EQ(paths.configPath, "/etc/snapkeep.json");
    EXPECT_NE(paths.configPath, paths.defaultConfigPath);

    ConfigPaths defaults = ConfigPaths::defaults();
    EXPECT_EQ(defaults.configPath, defaults.defaultConfigPath);
}
