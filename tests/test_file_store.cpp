#include "test_support.hpp"

#include "errors.hpp"
#include "file_store.hpp"
#include "salt_source.hpp"
#include "token_vault.hpp"

#include <fstream>

class FileStoreTest : public VaultTestBase {
protected:
    TempDir dir;

    mode_t file_mode(const std::string& path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) return 0;
        return st.st_mode & 0777;
    }

    bool exists(const std::string& path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }
};

TEST_F(FileStoreTest, values_persist_across_instances) {
    {
        FileStore store(dir.path());
        store.put("app.sdk", "access_token", "v1");
        store.put("app.sdk", "user_id", "v2");
    }
    FileStore reopened(dir.path());
    EXPECT_EQ(reopened.get("app.sdk", "access_token").value(), "v1");
    EXPECT_EQ(reopened.get("app.sdk", "user_id").value(), "v2");
    EXPECT_FALSE(reopened.get("app.sdk", "expires_at").has_value());
    EXPECT_FALSE(reopened.contains("app.sdk", "expires_at"));
}

TEST_F(FileStoreTest, special_characters_survive) {
    FileStore store(dir.path());
    const std::string v = "tab\there\nnewline\\backslash\\n literal";
    store.put("app.sdk", "k\tey", v);
    EXPECT_EQ(store.get("app.sdk", "k\tey").value(), v);
}

TEST_F(FileStoreTest, batch_applies_puts_and_removes_together) {
    FileStore store(dir.path());
    store.put("app.sdk", "a", "1");

    StoreBatch b;
    b.put("b", "2").put("c", "3").remove("a");
    store.apply("app.sdk", b);

    EXPECT_FALSE(store.contains("app.sdk", "a"));
    EXPECT_EQ(store.get("app.sdk", "b").value(), "2");
    EXPECT_EQ(store.get("app.sdk", "c").value(), "3");
}

TEST_F(FileStoreTest, file_is_owner_only) {
    FileStore store(dir.path());
    store.put("app.sdk", "a", "1");
    EXPECT_EQ(file_mode(store.path_for("app.sdk")), static_cast<mode_t>(0600));
    EXPECT_EQ(file_mode(dir.path()), static_cast<mode_t>(0700));
}

TEST_F(FileStoreTest, removing_last_key_deletes_file) {
    FileStore store(dir.path());
    store.put("app.sdk", "a", "1");
    ASSERT_TRUE(exists(store.path_for("app.sdk")));

    store.remove("app.sdk", "a");
    EXPECT_FALSE(exists(store.path_for("app.sdk")));
    EXPECT_NO_THROW(store.remove("app.sdk", "a"));
}

TEST_F(FileStoreTest, creates_missing_root) {
    FileStore store(dir.file("nested"));
    store.put("app.sdk", "a", "1");
    EXPECT_TRUE(exists(dir.file("nested/app.sdk.kv")));
}

TEST_F(FileStoreTest, rejects_bad_namespace_names) {
    FileStore store(dir.path());
    for (const char* ns : { "", ".", "..", ".hidden", "../escape", "a/b", "sp ace" }) {
        EXPECT_THROW(store.put(ns, "a", "1"), StoreError) << "'" << ns << "'";
    }
}

TEST_F(FileStoreTest, empty_key_is_rejected) {
    FileStore store(dir.path());
    store.put("app.sdk", "a", "1");
    EXPECT_THROW(store.put("app.sdk", "", "v"), StoreError);

    StoreBatch batch;
    batch.put("b", "2");
    batch.remove("");
    EXPECT_THROW(store.apply("app.sdk", batch), StoreError);

    EXPECT_EQ(store.get("app.sdk", "a"), std::optional<std::string>("1"));
    EXPECT_FALSE(store.contains("app.sdk", "b"));
}

TEST_F(FileStoreTest, insecure_permissions_are_refused) {
    FileStore store(dir.path());
    store.put("app.sdk", "a", "1");
    ASSERT_EQ(chmod(store.path_for("app.sdk").c_str(), 0644), 0);
    EXPECT_THROW(store.get("app.sdk", "a"), StoreError);
}

TEST_F(FileStoreTest, malformed_lines_are_skipped) {
    FileStore store(dir.path());
    const std::string path = store.path_for("app.sdk");
    {
        std::ofstream out(path);
        out << "good\tvalue\n" << "no-tab-here\n" << "\tmissing-key\n" << "\n";
    }
    ASSERT_EQ(chmod(path.c_str(), 0600), 0);
    EXPECT_EQ(store.get("app.sdk", "good").value(), "value");
    EXPECT_FALSE(store.contains("app.sdk", "no-tab-here"));
}

TEST_F(FileStoreTest, root_that_is_a_file_is_rejected) {
    const std::string f = dir.file("plain");
    { std::ofstream out(f); out << "x"; }
    EXPECT_THROW(FileStore store(f), StoreError);
}

TEST(EntryFormatTest, serialize_then_parse) {
    std::map<std::string, std::string> m = {
        { "access_token", "QUJD+/==" },
        { "multi", "a\nb\\c" },
    };
    std::string text = serialize_entries(m);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
    EXPECT_EQ(deserialize_entries(text), m);
}

TEST(EntryFormatTest, escape_is_reversible) {
    const std::string s = "\\n is not a newline\n\t";
    EXPECT_EQ(unescape_str(escape_str(s)), s);
    EXPECT_EQ(escape_str(s).find('\n'), std::string::npos);
}

TEST_F(FileStoreTest, vault_record_persists_on_disk) {
    FixedSaltSource salt{ std::string("device-xyz") };
    AppNamespaceResolver resolver{ "com.example.app" };
    CipherCodec codec{ fast_kdf() };

    AccessTokenRecord rec;
    rec.access_token = "abc123";
    rec.expires_at = 1700000000;
    rec.refresh_token = "ref456";
    rec.user_id = "u-42";

    {
        FileStore store(dir.path());
        TokenVault vault(store, salt, resolver, codec);
        vault.save("k1", rec);
    }

    FileStore store(dir.path());
    TokenVault vault(store, salt, resolver, codec);
    EXPECT_EQ(vault.state(), VaultState::Populated);
    auto loaded = vault.load("k1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, rec);

    vault.clear();
    EXPECT_FALSE(exists(store.path_for("com.example.app.sdk")));
}
