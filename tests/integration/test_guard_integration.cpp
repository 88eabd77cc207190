#include "../test_utils.hpp"

#include <csignal>
#include <fcntl.h>
#include <fstream>
#include <gtest/gtest.h>
#include <mcpguard/errors.hpp>
#include <mcpguard/guard_proxy.hpp>
#include <unistd.h>

using namespace mcpguard;
using namespace mcpguard::test;

namespace
{
// Minimal line-oriented tool server: answers tools/list with two tools and
// everything else with an empty result, echoing the numeric id.
const char* MOCK_SERVER = R"SH(
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":\([0-9]*\).*/\1/p')
  case "$line" in
    *'"tools/list"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"read_file"},{"name":"write_file"}]}}\n' "$id" ;;
    *)
      printf '{"jsonrpc":"2.0","id":%s,"result":{}}\n' "$id" ;;
  esac
done
)SH";

// Client side of the proxy: requests are written up front, replies collected
// after the session ends
class ClientPipes
{
  public:
    ClientPipes()
    {
        if (!make_cloexec_pipe(to_guard_) || !make_cloexec_pipe(from_guard_))
            throw std::runtime_error("pipe failed");
    }

    ~ClientPipes()
    {
        for (int fd : {to_guard_[0], to_guard_[1], from_guard_[0], from_guard_[1]})
            if (fd >= 0)
                ::close(fd);
    }

    void send(const json& message)
    {
        send_raw(message.dump() + "\n");
    }

    void send_raw(const std::string& data)
    {
        ASSERT_EQ(::write(to_guard_[1], data.data(), data.size()),
                  static_cast<ssize_t>(data.size()));
    }

    void close_input()
    {
        ::close(to_guard_[1]);
        to_guard_[1] = -1;
    }

    std::vector<json> replies()
    {
        ::close(from_guard_[1]);
        from_guard_[1] = -1;

        std::string data;
        char buffer[4096];
        ssize_t n;
        while ((n = ::read(from_guard_[0], buffer, sizeof(buffer))) > 0)
            data.append(buffer, static_cast<size_t>(n));

        std::vector<json> messages;
        std::istringstream stream(data);
        std::string line;
        while (std::getline(stream, line))
            if (!line.empty())
                messages.push_back(json::parse(line));
        return messages;
    }

    int guard_input() const
    {
        return to_guard_[0];
    }

    int guard_output() const
    {
        return from_guard_[1];
    }

  private:
    int to_guard_[2] = {-1, -1};
    int from_guard_[2] = {-1, -1};
};

class GuardIntegrationTest : public ::testing::Test
{
  protected:
    static void SetUpTestSuite()
    {
        std::signal(SIGPIPE, SIG_IGN);
    }

    GuardIntegrationTest() : logger_(log_) {}

    std::ostringstream log_;
    Logger logger_;
    ClientPipes client_pipes_;
};
} // namespace

TEST_F(GuardIntegrationTest, FiltersAndBlocksAgainstRealChild)
{
    GuardOptions options;
    options.command = {"sh", "-c", MOCK_SERVER};
    auto child = create_child_transport(options);
    child->connect();

    auto client = create_stdio_transport(client_pipes_.guard_input(), client_pipes_.guard_output());

    client_pipes_.send(make_request(1, "tools/list"));
    client_pipes_.send(make_request(2, "tools/call", {{"name", "write_file"}}));
    client_pipes_.send(make_request(3, "tools/call", {{"name", "read_file"}}));
    client_pipes_.send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    client_pipes_.close_input();

    GuardSession session(Policy({{"tool", {"read_*"}}}, {}), logger_, *client, *child);
    EXPECT_NO_THROW(session.run());
    child->close();

    auto replies = client_pipes_.replies();
    ASSERT_EQ(replies.size(), 3u);

    EXPECT_EQ(replies[0]["id"], 1);
    ASSERT_EQ(replies[0]["result"]["tools"].size(), 1u);
    EXPECT_EQ(replies[0]["result"]["tools"][0]["name"], "read_file");

    EXPECT_EQ(replies[1]["id"], 2);
    EXPECT_EQ(replies[1]["error"]["code"], -32000);
    EXPECT_EQ(replies[1]["error"]["message"], "tool not found: write_file");

    EXPECT_EQ(replies[2]["id"], 3);
    EXPECT_TRUE(replies[2]["result"].is_object());

    EXPECT_EQ(count_lines_containing(log_, "Client disconnected (EOF)"), 1u);
}

TEST_F(GuardIntegrationTest, StartupBannerOnStdoutDoesNotShiftReplies)
{
    GuardOptions options;
    std::string script = std::string("printf 'Server started on stdio\\n'\n") + MOCK_SERVER;
    options.command = {"sh", "-c", script};
    auto child = create_child_transport(options);
    child->connect();

    auto client = create_stdio_transport(client_pipes_.guard_input(), client_pipes_.guard_output());

    client_pipes_.send(make_request(1, "tools/call", {{"name", "read_file"}}));
    client_pipes_.send(make_request(2, "tools/list"));
    client_pipes_.close_input();

    GuardSession session(Policy({}, {{"tool", {"write_*"}}}), logger_, *client, *child);
    EXPECT_NO_THROW(session.run());
    child->close();

    auto replies = client_pipes_.replies();
    ASSERT_EQ(replies.size(), 2u);

    EXPECT_EQ(replies[0]["id"], 1);
    EXPECT_EQ(replies[0]["error"]["code"], -32000);

    EXPECT_EQ(replies[1]["id"], 2);
    ASSERT_EQ(replies[1]["result"]["tools"].size(), 1u);
    EXPECT_EQ(replies[1]["result"]["tools"][0]["name"], "read_file");

    EXPECT_EQ(count_lines_containing(log_, "Error reading response from child"), 1u);
    EXPECT_EQ(count_lines_containing(log_, "Dropping late child reply"), 1u);
}

TEST_F(GuardIntegrationTest, ChildExitWhileRequestOutstanding)
{
    GuardOptions options;
    options.command = {"sh", "-c", "read line; exit 3"};
    auto child = create_child_transport(options);
    child->connect();

    auto client = create_stdio_transport(client_pipes_.guard_input(), client_pipes_.guard_output());
    client_pipes_.send(make_request(1, "tools/call", {{"name", "read_file"}}));
    client_pipes_.close_input();

    GuardSession session(Policy(), logger_, *client, *child);
    EXPECT_THROW(session.run(), ChildUnavailableError);
    child->close();

    EXPECT_TRUE(client_pipes_.replies().empty());
    EXPECT_EQ(count_lines_containing(log_, "Child process disconnected (EOF)"), 1u);
    ASSERT_TRUE(child->exit_code().has_value());
    EXPECT_EQ(*child->exit_code(), 3);
}

TEST_F(GuardIntegrationTest, MalformedClientInputEndsSession)
{
    GuardOptions options;
    options.command = {"cat"};
    auto child = create_child_transport(options);
    child->connect();

    auto client = create_stdio_transport(client_pipes_.guard_input(), client_pipes_.guard_output());
    client_pipes_.send_raw("{\"id\":1,\"method\":}\n");
    client_pipes_.send(make_request(2, "tools/list"));
    client_pipes_.close_input();

    GuardSession session(Policy(), logger_, *client, *child);
    EXPECT_THROW(session.run(), ProtocolDecodeError);
    child->close();

    EXPECT_TRUE(client_pipes_.replies().empty());
    EXPECT_EQ(count_lines_containing(log_, "Error decoding request"), 1u);
}

TEST(RunGuardTest, FailsWhenChildCannotStart)
{
    auto dir = unique_temp_path("mcpguard-run");
    GuardOptions options;
    options.command = {"mcpguard-no-such-server-12345"};
    options.log_file = (dir / "guard.log").string();

    EXPECT_EQ(run_guard(options), 1);

    std::ifstream log(*options.log_file);
    std::string contents((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("Starting guard proxy for command: mcpguard-no-such-server-12345"),
              std::string::npos);
    EXPECT_NE(contents.find("Executable not found"), std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(RunGuardTest, FailsWhenLogFileCannotBeOpened)
{
    auto dir = unique_temp_path("mcpguard-run");
    std::filesystem::create_directories(dir);

    GuardOptions options;
    options.command = {"cat"};
    options.log_file = dir.string();

    EXPECT_EQ(run_guard(options), 1);

    std::filesystem::remove_all(dir);
}
