#include <gtest/gtest.h>
#include "schedule/crontab.hpp"
#include "test_utils.hpp"

using namespace snapkeep;

namespace {

class FakeCrontab : public Crontab {
public:
    std::optional<std::vector<std::string>> read() const override {
        if (failRead) {
            return std::nullopt;
        }
        return lines;
    }
    bool write(const std::vector<std::string>& newLines) const override {
        written.push_back(newLines);
        lines = newLines;
        return true;
    }

    bool failRead = false;
    mutable std::vector<std::string> lines;
    mutable std::vector<std::vector<std::string>> written;
};

} // namespace

TEST(CrontabTest, RemoveManagedDropsMarkerAndFollowingLine) {
    std::vector<std::string> lines = {
        "# my jobs",
        Crontab::MARKER,
        "0 * * * * /usr/bin/snapkeep backup-job",
        "@daily /usr/bin/logrotate",
        Crontab::MARKER,
        "@reboot /usr/bin/snapkeep --profile-id 2 backup-job"
    };
    EXPECT_EQ(Crontab::removeManaged(lines),
              (std::vector<std::string>{"# my jobs", "@daily /usr/bin/logrotate"}));
}

TEST(CrontabTest, AppendManagedPrefixesEachEntry) {
    auto lines = Crontab::appendManaged({"MAILTO=me"}, {"a", "b"});
    EXPECT_EQ(lines, (std::vector<std::string>{"MAILTO=me", Crontab::MARKER, "a", Crontab::MARKER, "b"}));
    EXPECT_EQ(Crontab::removeManaged(lines), (std::vector<std::string>{"MAILTO=me"}));
}

TEST(CrontabTest, InstallWritesOnlyOnChange) {
    FakeCrontab crontab;
    crontab.lines = {"MAILTO=me"};

    ASSERT_EQ(crontab.install({"*/5 * * * * cmd"}), Crontab::InstallResult::Written);
    ASSERT_EQ(crontab.written.size(), 1u);
    EXPECT_EQ(crontab.lines.back(), "*/5 * * * * cmd");

    ASSERT_EQ(crontab.install({"*/5 * * * * cmd"}), Crontab::InstallResult::Unchanged);
    EXPECT_EQ(crontab.written.size(), 1u);

    ASSERT_EQ(crontab.install({}), Crontab::InstallResult::Written);
    EXPECT_EQ(crontab.lines, (std::vector<std::string>{"MAILTO=me"}));
}

TEST(CrontabTest, InstallFailsWhenCrontabCannotBeRead) {
    FakeCrontab crontab;
    crontab.failRead = true;
    EXPECT_EQ(crontab.install({"x"}), Crontab::InstallResult::Failed);
    EXPECT_TRUE(crontab.written.empty());
}

TEST(CrontabTest, FindCronDaemonLooksAtProcessNames) {
    testing_utils::TempDir proc;
    ASSERT_FALSE(proc.path().empty());
    proc.write("1/comm", "systemd\n");
    proc.write("self/comm", "cron\n");
    proc.write("412/comm", "sshd\n");
    EXPECT_FALSE(Crontab::findCronDaemon(proc.path()));

    proc.write("977/comm", "crond\n");
    EXPECT_TRUE(Crontab::findCronDaemon(proc.path()));
}

TEST(CrontabTest, FindCronDaemonWithoutProcessTable) {
    testing_utils::TempDir proc;
    EXPECT_FALSE(Crontab::findCronDaemon(proc.file("missing")));
}
