#include <gtest/gtest.h>
#include <quartermaster/insight/analyst.hpp>
#include <quartermaster/testing/common.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef QUARTERMASTER_CLI_PATH
#define QUARTERMASTER_CLI_PATH ""
#endif

using quartermaster::testing::make_db_path;
using quartermaster::testing::remove_path;

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::vector<std::string> split_lines(const std::string& text) {
  auto lines = std::vector<std::string>{};
  auto input = std::istringstream{text};
  auto line = std::string{};
  while (std::getline(input, line)) {
    lines.push_back(line);
  }
  return lines;
}

void write_text(const std::string& path, const std::string_view text) {
  auto out = std::ofstream{path, std::ios::binary};
  out << text;
}

std::string read_text(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  auto buffer = std::ostringstream{};
  buffer << input.rdbuf();
  return buffer.str();
}

// One scratch database and working files per test.
class cli_session final {
 public:
  cli_session() : root_{make_db_path("quartermaster_cli")} {
    std::filesystem::create_directories(root_);
  }

  ~cli_session() { remove_path(root_); }

  std::string path(const std::string_view name) const {
    return (std::filesystem::path{root_} / name).string();
  }

  std::pair<int, std::string> run(const std::string& args,
                                  const std::string& prefix = {}) const {
    auto command = prefix + " " + shell_quote(QUARTERMASTER_CLI_PATH) +
                   " --db " +
                   shell_quote(path("db")) + " --log-level off " + args +
                   " 2>/dev/null";
    return run_capture(command);
  }

  std::pair<int, std::string> run_with_stderr(const std::string& args) const {
    auto command = shell_quote(QUARTERMASTER_CLI_PATH) + " --db " +
                   shell_quote(path("db")) + " --log-level off " + args +
                   " 2>&1";
    return run_capture(command);
  }

 private:
  std::string root_;
};

}  // namespace

TEST(cli, binary_path_is_configured) {
  ASSERT_FALSE(std::string{QUARTERMASTER_CLI_PATH}.empty());
  ASSERT_TRUE(std::filesystem::exists(QUARTERMASTER_CLI_PATH));
}

TEST(cli, seed_and_list_assets) {
  auto session = cli_session{};
  auto [seed_code, seed_output] = session.run("seed");
  ASSERT_EQ(seed_code, 0);

  auto [code, output] = session.run("asset-list");
  ASSERT_EQ(code, 0);
  auto lines = split_lines(output);
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[1],
            "AST-002\tBorrowed\tSony Alpha a7 IV\tCamera\tAlice Chen");
  EXPECT_EQ(lines[2], "AST-003\tMaintenance\tDJI Mavic 3 Pro\tDrone\t-");

  auto [filtered_code, filtered] = session.run("asset-list --category Drone");
  ASSERT_EQ(filtered_code, 0);
  EXPECT_EQ(split_lines(filtered).size(), 1u);

  auto [again_code, again] = session.run("seed");
  EXPECT_EQ(again_code, 1);
}

TEST(cli, borrow_and_return_with_signature) {
  auto session = cli_session{};
  ASSERT_EQ(session.run("seed").first, 0);
  const auto strokes = session.path("strokes.txt");
  write_text(strokes, "10,10 60,80 120,40\n130,50 200,150\n");

  auto [unsigned_code, unsigned_output] =
      session.run("borrow --id AST-001 --user 'Bob Smith'");
  EXPECT_EQ(unsigned_code, 1);

  auto [borrow_code, borrow_output] =
      session.run("borrow --id AST-001 --user 'Bob Smith' --strokes " +
                  shell_quote(strokes) + " --notes 'Site visit'");
  ASSERT_EQ(borrow_code, 0);
  EXPECT_FALSE(borrow_output.empty());

  auto [list_code, listed] = session.run("asset-list --status Borrowed");
  ASSERT_EQ(list_code, 0);
  auto lines = split_lines(listed);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "AST-001\tBorrowed\tMacBook Pro 16\"\tLaptop\tBob Smith");

  auto [again_code, again] = session.run(
      "borrow --id AST-001 --user 'Alice Chen' --strokes " +
      shell_quote(strokes));
  EXPECT_EQ(again_code, 1);

  auto [return_code, returned] = session.run(
      "return --id AST-001 --user 'Bob Smith' --strokes " +
      shell_quote(strokes));
  ASSERT_EQ(return_code, 0);

  auto [ledger_code, ledger] = session.run("ledger --id AST-001");
  ASSERT_EQ(ledger_code, 0);
  auto entries = split_lines(ledger);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_NE(entries[0].find("\tReturn\tAST-001\t"), std::string::npos);
  EXPECT_NE(entries[1].find("\tBorrow\tAST-001\t"), std::string::npos);
  EXPECT_NE(entries[1].find("\tSite visit"), std::string::npos);
}

TEST(cli, notifications_follow_overdue_setting) {
  auto session = cli_session{};
  ASSERT_EQ(session.run("seed").first, 0);

  auto [code, output] = session.run("notifications");
  ASSERT_EQ(code, 0);
  EXPECT_TRUE(output.empty());

  auto [short_code, short_output] =
      session.run("notifications --overdue-days 1");
  ASSERT_EQ(short_code, 0);
  EXPECT_EQ(short_output,
            "warning\tOverdue Alert\tSony Alpha a7 IV held by Alice Chen for "
            ">1 days.\n");

  ASSERT_EQ(session.run("asset-edit --id AST-004 --status Lost").first, 0);
  auto [lost_code, lost] = session.run("notifications");
  ASSERT_EQ(lost_code, 0);
  EXPECT_EQ(lost,
            "critical\tAsset Lost Alert\tProjector 4K (AST-004) is marked as "
            "Lost.\n");
}

TEST(cli, import_export_and_bulk_edit) {
  auto session = cli_session{};
  const auto input = session.path("import.csv");
  write_text(input,
             "Name,Category,Model,Serial\n"
             "Drone X,Drone,V2,SN1\n"
             ",BadRow,,\n"
             "Tablet Y,Tablet,T1,SN2\n");

  auto [import_code, imported] =
      session.run("import --file " + shell_quote(input));
  ASSERT_EQ(import_code, 0);
  EXPECT_EQ(imported, "imported 2, skipped 1\n");

  auto [list_code, listed] = session.run("asset-list");
  ASSERT_EQ(list_code, 0);
  auto lines = split_lines(listed);
  ASSERT_EQ(lines.size(), 2u);
  auto first_id = lines[0].substr(0, lines[0].find('\t'));
  auto second_id = lines[1].substr(0, lines[1].find('\t'));

  auto [bulk_code, bulk] = session.run(
      "bulk-edit --id " + first_id + " --id AST-999 --id " + second_id +
      " --status Maintenance");
  ASSERT_EQ(bulk_code, 0);
  EXPECT_EQ(bulk, "2 changed\n");

  auto [rejected_code, rejected] =
      session.run("bulk-edit --id " + first_id + " --status Borrowed");
  EXPECT_EQ(rejected_code, 1);

  const auto output = session.path("assets.csv");
  auto [export_code, exported] =
      session.run("export --out " + shell_quote(output));
  ASSERT_EQ(export_code, 0);
  EXPECT_EQ(exported, output + "\n");
  auto content = read_text(output);
  EXPECT_EQ(content.rfind("\xEF\xBB\xBF" "ID,Asset Name,Category", 0), 0u);
  EXPECT_NE(content.find("Drone X,Drone,V2,SN1,Maintenance"),
            std::string::npos);

  auto [empty_code, empty] = session.run(
      "export --status Lost --out " + shell_quote(session.path("none.csv")));
  EXPECT_EQ(empty_code, 1);
  EXPECT_FALSE(std::filesystem::exists(session.path("none.csv")));
}

TEST(cli, qr_export_writes_zip) {
  auto session = cli_session{};
  ASSERT_EQ(session.run("seed").first, 0);

  const auto archive = session.path("labels.zip");
  auto [code, output] = session.run(
      "qr-export --id AST-001 --id AST-002 --out " + shell_quote(archive));
  ASSERT_EQ(code, 0);
  EXPECT_EQ(output, archive + "\n");
  auto bytes = read_text(archive);
  ASSERT_GT(bytes.size(), 4u);
  EXPECT_EQ(bytes.substr(0, 2), "PK");

  auto [missing_code, missing] =
      session.run("qr-export --id AST-404 --out " + shell_quote(archive));
  EXPECT_EQ(missing_code, 1);
}

TEST(cli, users_reservations_and_stats) {
  auto session = cli_session{};
  ASSERT_EQ(session.run("seed").first, 0);

  auto [add_code, added] = session.run(
      "user-add --name 'Erin Field' --email erin@company.com --role Operator");
  ASSERT_EQ(add_code, 0);
  EXPECT_FALSE(added.empty());

  auto [users_code, users] = session.run("user-list --search erin");
  ASSERT_EQ(users_code, 0);
  EXPECT_EQ(split_lines(users).size(), 1u);

  auto [res_code, reserved] = session.run(
      "reservation-add --id AST-005 --user U002 --start 2024-07-01 "
      "--end 2024-07-05");
  ASSERT_EQ(res_code, 0);
  auto [list_code, reservations] = session.run("reservation-list");
  ASSERT_EQ(list_code, 0);
  EXPECT_EQ(split_lines(reservations).size(), 2u);

  auto [stats_code, stats] = session.run("stats");
  ASSERT_EQ(stats_code, 0);
  auto lines = split_lines(stats);
  ASSERT_GE(lines.size(), 5u);
  EXPECT_EQ(lines[0], "total\t5");
  EXPECT_EQ(lines[1], "available\t3");
  EXPECT_EQ(lines[2], "borrowed\t1");
  EXPECT_EQ(lines[3], "maintenance\t1");
  EXPECT_EQ(lines[4], "lost\t0");
}

TEST(cli, insight_uses_credential_from_environment) {
  auto session = cli_session{};
  ASSERT_EQ(session.run("seed").first, 0);

  auto [missing_code, missing] =
      session.run("insight", "env -u QUARTERMASTER_API_KEY");
  ASSERT_EQ(missing_code, 0);
  EXPECT_EQ(missing,
            std::string{quartermaster::insight::kMissingKeyMessage} + "\n");

  auto [unconfigured_code, unconfigured] =
      session.run("insight", "env QUARTERMASTER_API_KEY=secret");
  EXPECT_EQ(unconfigured_code, 2);

  auto [code, output] = session.run("insight --analyst-command cat",
                                    "env QUARTERMASTER_API_KEY=secret");
  ASSERT_EQ(code, 0);
  EXPECT_NE(output.find("\"totalAssets\":5"), std::string::npos);
}

TEST(cli, usage_errors_exit_with_two) {
  auto session = cli_session{};
  EXPECT_EQ(run_capture(shell_quote(QUARTERMASTER_CLI_PATH) +
                        " >/dev/null 2>&1")
                .first,
            2);
  EXPECT_EQ(run_capture(shell_quote(QUARTERMASTER_CLI_PATH) +
                        " --help >/dev/null 2>&1")
                .first,
            0);
  EXPECT_EQ(session.run("teleport").first, 2);
  EXPECT_EQ(session.run("borrow --user 'Bob Smith'").first, 2);
  EXPECT_EQ(session.run("asset-list --status Vanished").first, 2);
  EXPECT_EQ(session.run("asset-list --no-such-flag").first, 2);
  EXPECT_EQ(session.run("asset-list --qr-ecc X").first, 2);

  auto [code, output] = session.run_with_stderr("teleport");
  EXPECT_EQ(code, 2);
  EXPECT_NE(output.find("unknown command 'teleport'"), std::string::npos);
}
