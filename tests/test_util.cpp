#include "test_support.hpp"

#include "logging.hpp"
#include "util.hpp"

TEST(Utf8Test, accepts_well_formed_text) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xc3\xa5"));             // U+00E5
    EXPECT_TRUE(is_valid_utf8("\xe2\x82\xac"));         // U+20AC
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x94\x91"));     // U+1F511
    EXPECT_TRUE(is_valid_utf8(std::string("nul\0inside", 10)));
}

TEST(Utf8Test, rejects_malformed_text) {
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\x80"));                // lone continuation
    EXPECT_FALSE(is_valid_utf8("\xc3"));                // truncated
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));            // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));        // surrogate
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));    // above U+10FFFF
}

TEST(ParseEpochTest, accepts_plain_integers) {
    std::int64_t v = 0;
    EXPECT_TRUE(parse_epoch("1700000000", v));
    EXPECT_EQ(v, 1700000000);
    EXPECT_TRUE(parse_epoch("-5", v));
    EXPECT_EQ(v, -5);
    EXPECT_TRUE(parse_epoch("9223372036854775807", v));
    EXPECT_EQ(v, std::numeric_limits<std::int64_t>::max());
}

TEST(ParseEpochTest, rejects_everything_else) {
    std::int64_t v = 7;
    for (const char* s : { "", " 1", "1 ", "+1", "1.5", "0x10", "abc", "9223372036854775808" }) {
        EXPECT_FALSE(parse_epoch(s, v)) << "'" << s << "'";
    }
    EXPECT_EQ(v, 7);
}

TEST(NamespaceNameTest, validation) {
    EXPECT_TRUE(valid_namespace("com.example.app.sdk"));
    EXPECT_TRUE(valid_namespace("a_b-c"));
    EXPECT_FALSE(valid_namespace(""));
    EXPECT_FALSE(valid_namespace(".."));
    EXPECT_FALSE(valid_namespace("a/b"));
    EXPECT_FALSE(valid_namespace(std::string(MAX_NAMESPACE_LEN + 1, 'a')));
}

TEST(CliArgsTest, accepts_known_command_shapes) {
    EXPECT_TRUE(valid_cli_args({"status"}));
    EXPECT_TRUE(valid_cli_args({"clear"}));
    EXPECT_TRUE(valid_cli_args({"save", "alice", "1700000000"}));
    EXPECT_TRUE(valid_cli_args({"show"}));
    EXPECT_TRUE(valid_cli_args({"show", "--reveal"}));
}

TEST(CliArgsTest, rejects_unknown_commands_and_wrong_arity) {
    EXPECT_FALSE(valid_cli_args({}));
    EXPECT_FALSE(valid_cli_args({"bogus"}));
    EXPECT_FALSE(valid_cli_args({"--help"}));
    EXPECT_FALSE(valid_cli_args({"status", "extra"}));
    EXPECT_FALSE(valid_cli_args({"clear", "now"}));
    EXPECT_FALSE(valid_cli_args({"save", "alice"}));
    EXPECT_FALSE(valid_cli_args({"save", "alice", "1", "2"}));
    EXPECT_FALSE(valid_cli_args({"show", "--all"}));
    EXPECT_FALSE(valid_cli_args({"show", "--reveal", "x"}));
}

TEST(SecureClearTest, record_is_emptied) {
    AccessTokenRecord r{ "abc123", 1700000000, "ref456", "u-42" };
    secure_clear_record(r);
    EXPECT_EQ(r, AccessTokenRecord{});
}

TEST(SessionIdTest, is_random_hex) {
    ASSERT_GE(sodium_init(), 0);
    std::string a = generate_session_id();
    std::string b = generate_session_id();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

class AuditLogTest : public VaultTestBase {};

TEST_F(AuditLogTest, writes_one_line_per_entry) {
    init_log_context();
    audit_log_level(LogLevel::WARN, "first\nsecond", "vault_load", "failure");

    std::string log = read_audit_log();
    EXPECT_EQ(std::count(log.begin(), log.end(), '\n'), 1);
    EXPECT_NE(log.find("| WARN |"), std::string::npos);
    EXPECT_NE(log.find("event=vault_load"), std::string::npos);
    EXPECT_NE(log.find("outcome=failure"), std::string::npos);
    EXPECT_NE(log.find("first second"), std::string::npos);
    EXPECT_NE(log.find("session=" + g_log_ctx.sessionId), std::string::npos);
}

TEST_F(AuditLogTest, entries_below_threshold_are_dropped) {
    set_audit_min_level(LogLevel::ERROR);
    audit_log_level(LogLevel::INFO, "quiet");
    audit_log_level(LogLevel::ALERT, "loud");

    std::string log = read_audit_log();
    EXPECT_EQ(log.find("quiet"), std::string::npos);
    EXPECT_NE(log.find("loud"), std::string::npos);
}

TEST(LogLevelTest, parse_names) {
    LogLevel l = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("alert", l));
    EXPECT_EQ(l, LogLevel::ALERT);
    EXPECT_TRUE(parse_log_level("Error", l));
    EXPECT_EQ(l, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("debug", l));
    EXPECT_STREQ(log_level_str(LogLevel::WARN), "WARN");
}
