/**
 * @file test_store.cpp
 * @brief End-to-end tests for ConfigStore (GoogleTest)
 *
 * Tests cover:
 * - RULE S1: Locking around every operation
 * - RULE S2: Comment-preserving set
 * - RULE S3: Atomic persistence
 * - RULE S4: Validate-then-commit multiset
 * - RULE S5: Dry-run purity
 * - RULE S6: Missing file handling
 */

#include <gtest/gtest.h>
#include "confstore/Errors.hpp"
#include "confstore/FileLock.hpp"
#include "confstore/Store.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

using namespace confstore;
using namespace confstore_test;
using namespace std::chrono_literals;

class StoreTest : public ::testing::Test {
protected:
    TempDir dir;

    std::string write(const std::string& content, const std::string& name = "cfg.yaml") {
        return dir.create_file(name, content);
    }
};

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(StoreTest, SetKeepsCommentLine) {
    const std::string path = write("foo: 1\n# note\nbar: 2\n");
    ConfigStore store(path);

    auto changes = store.set("bar", 3);

    EXPECT_EQ(read_file(path), "foo: 1\n# note\nbar: 3\n");
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].key, "bar");
    EXPECT_EQ(changes[0].old_value, Value(2));
    EXPECT_EQ(changes[0].new_value, 3);
}

TEST_F(StoreTest, PopReturnsLastElement) {
    const std::string path = write("items: [1,2,3]\n");
    ConfigStore store(path);

    EXPECT_EQ(store.pop("items"), 3);
    EXPECT_EQ(store.get("items"), Value({1, 2}));
}

TEST_F(StoreTest, PushCreatesThenAppends) {
    const std::string path = write("{}\n");
    ConfigStore store(path);

    store.push("tags", "x");
    store.push("tags", "y");

    EXPECT_EQ(store.get("tags"), Value({"x", "y"}));
}

TEST_F(StoreTest, MultisetWritesOnce) {
    const std::string path = write("{}\n");
    StoreOptions options;
    int commits = 0;
    options.write.before_commit = [&](const std::string&) { ++commits; };
    ConfigStore store(path, options);

    auto changes = store.multiset({{"a.b", "1"}, {"a.c", "2"}});

    EXPECT_EQ(commits, 1);
    EXPECT_EQ(store.get(""), Value({{"a", {{"b", 1}, {"c", 2}}}}));
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_FALSE(changes[0].old_value.has_value());
}

TEST_F(StoreTest, NegativeIndexGet) {
    const std::string path = write("items: [10,20,30]\n");
    ConfigStore store(path);

    EXPECT_EQ(store.get("items[-1]"), Value(30));
    EXPECT_FALSE(store.get("items[-4]").has_value());
}

TEST_F(StoreTest, FailedMultisetLeavesFileUntouched) {
    const std::string original = "x: 1\n";
    const std::string path = write(original);
    ConfigStore store(path);

    try {
        store.multiset({{"x", "2"}, {"y[5]", "z"}});
        FAIL() << "Expected BatchError";
    } catch (const BatchError& e) {
        EXPECT_EQ(e.index(), 1u);
        EXPECT_EQ(e.key(), "y[5]");
    }
    EXPECT_EQ(read_file(path), original);
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(StoreTest, SetThenGetRoundTrips) {
    const std::string path = write(
        "name: demo\n"
        "server:\n"
        "  port: 80\n"
        "  hosts: [a, b]\n");
    ConfigStore store(path);

    const std::vector<std::pair<std::string, Value>> cases = {
        {"name", "other"},
        {"server.port", 8080},
        {"server.hosts[-1]", "c"},
        {"server.hosts[0]", true},
        {"name", "123"},
        {"name", nullptr},
        {"server", Value({{"nested", {1, 2}}})},
    };
    for (const auto& [key, value] : cases) {
        store.set(key, value);
        EXPECT_EQ(store.get(key), value) << key;
    }
}

TEST_F(StoreTest, NegativeIndexEquivalence) {
    const std::string path = write("seq: [a, b, c, d]\nempty: []\n");
    ConfigStore store(path);

    EXPECT_EQ(store.get("seq[-1]"), store.get("seq[3]"));
    EXPECT_EQ(store.get("seq[-4]"), store.get("seq[0]"));
    EXPECT_FALSE(store.get("empty[-1]").has_value());
    EXPECT_THROW(store.set("empty[-1]", 1), PathError);
}

TEST_F(StoreTest, BatchAtomicityForEveryFailingPosition) {
    const std::string original = "# settings\nkeep: 1\nlist: [1, 2]\n";
    const std::vector<std::pair<std::string, std::string>> valid = {
        {"a", "1"}, {"b.c", "two"}, {"list[0]", "9"}, {"keep", "3.5"}
    };
    const std::pair<std::string, std::string> invalid{"list[7]", "x"};

    for (size_t j = 0; j <= valid.size(); ++j) {
        const std::string path = write(original);
        auto pairs = valid;
        pairs.insert(pairs.begin() + static_cast<std::ptrdiff_t>(j), invalid);

        ConfigStore store(path);
        try {
            store.multiset(pairs);
            FAIL() << "Expected BatchError at " << j;
        } catch (const BatchError& e) {
            EXPECT_EQ(e.index(), j);
        }
        EXPECT_EQ(read_file(path), original) << "failing pair at " << j;
    }
}

TEST_F(StoreTest, MultisetCoercesValues) {
    const std::string path = write("");
    ConfigStore store(path);

    store.multiset({{"i", "42"}, {"f", "1.5"}, {"s", "007"}, {"b", "true"},
                    {"h", ".5"}});

    EXPECT_EQ(store.get("i"), Value(42));
    EXPECT_EQ(store.get("f"), Value(1.5));
    EXPECT_EQ(store.get("s"), Value("007"));
    EXPECT_EQ(store.get("b"), Value("true"));
    EXPECT_EQ(store.get("h"), Value(0.5));
}

TEST_F(StoreTest, MultisetSeesEarlierPairs) {
    const std::string path = write("list: [1]\n");
    ConfigStore store(path);

    store.multiset({{"list", "5"}, {"list.x", "1"}});
    EXPECT_EQ(store.get("list"), Value({{"x", 1}}));
}

TEST_F(StoreTest, EraseIsIdempotent) {
    const std::string path = write("a: 1\nb: 2\n");
    ConfigStore store(path);

    EXPECT_TRUE(store.erase("a"));
    EXPECT_FALSE(store.get("a").has_value());

    const std::string after_first = read_file(path);
    const ino_t inode = inode_of(path);
    EXPECT_FALSE(store.erase("a"));
    EXPECT_FALSE(store.erase("a"));
    EXPECT_FALSE(store.erase("missing.deep.key"));
    EXPECT_EQ(read_file(path), after_first);
    EXPECT_EQ(inode_of(path), inode);
}

TEST_F(StoreTest, EraseThroughScalarThrows) {
    const std::string path = write("a: 1\n");
    ConfigStore store(path);
    EXPECT_THROW(store.erase("a.b"), PathError);
}

TEST_F(StoreTest, PopErrors) {
    const std::string path = write("name: x\nempty: []\n");
    ConfigStore store(path);

    EXPECT_THROW(store.pop("absent"), NotFoundError);
    EXPECT_THROW(store.pop("name"), PathError);
    EXPECT_THROW(store.pop("empty"), PathError);
}

TEST_F(StoreTest, PushOntoScalarThrows) {
    const std::string path = write("name: x\n");
    ConfigStore store(path);
    EXPECT_THROW(store.push("name", 1), PathError);
    EXPECT_EQ(read_file(path), "name: x\n");
}

TEST_F(StoreTest, SetPreservesCommentsOnEveryScalarUpdate) {
    const std::string original =
        "# Project settings\n"
        "project:\n"
        "  name: demo      # display name\n"
        "  version: 1.2.0\n"
        "\n"
        "# Build\n"
        "build:\n"
        "  flags: [-O2, -g]  # compiler\n"
        "  jobs: 4\n";
    const std::string path = write(original);
    ConfigStore store(path);

    store.set("project.version", "1.3.0");
    store.set("build.jobs", 8);
    store.set("build.flags[1]", "-Wall");

    const std::string text = read_file(path);
    EXPECT_NE(text.find("# Project settings\n"), std::string::npos);
    EXPECT_NE(text.find("  name: demo      # display name\n"), std::string::npos);
    EXPECT_NE(text.find("# Build\n"), std::string::npos);
    EXPECT_NE(text.find("  flags: [-O2, "), std::string::npos);
    EXPECT_NE(text.find("]  # compiler\n"), std::string::npos);
    EXPECT_NE(text.find("  jobs: 8\n"), std::string::npos);
    EXPECT_EQ(store.get("project.version"), Value("1.3.0"));
    EXPECT_EQ(store.get("build.flags"), Value({"-O2", "-Wall"}));
}

TEST_F(StoreTest, NewKeyFallsBackToRewrite) {
    const std::string path = write("# c\na: 1\n");
    ConfigStore store(path);

    auto changes = store.set("b.c", "x");

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_FALSE(changes[0].old_value.has_value());
    EXPECT_EQ(store.get(""), Value({{"a", 1}, {"b", {{"c", "x"}}}}));
}

// ============================================================================
// RULE S5: Dry-run
// ============================================================================

TEST_F(StoreTest, DryRunSetChangesNothing) {
    const std::string original = "a: 1\n";
    const std::string path = write(original);
    const auto mtime = fs::last_write_time(path);
    ConfigStore store(path);

    MutationOptions options;
    options.dry_run = true;
    auto changes = store.set("a", 2, options);

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].old_value, Value(1));
    EXPECT_EQ(changes[0].new_value, 2);
    EXPECT_EQ(read_file(path), original);
    EXPECT_EQ(fs::last_write_time(path), mtime);
    EXPECT_FALSE(fs::exists(path + ".lock"));
}

TEST_F(StoreTest, DryRunNeverCreatesFile) {
    const std::string path = dir.file("new.yaml");
    ConfigStore store(path);

    MutationOptions options;
    options.dry_run = true;
    options.create_missing = true;
    auto changes = store.multiset({{"a", "1"}, {"b", "x"}}, options);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_FALSE(changes[0].old_value.has_value());
    EXPECT_EQ(changes[0].new_value, 1);
    EXPECT_EQ(changes[1].new_value, "x");
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".lock"));
    EXPECT_EQ(dir.entry_count(), 0u);
}

TEST_F(StoreTest, DryRunRepeatedKeyReportsFileValue) {
    const std::string original = "a: 1\n";
    const std::string path = write(original);
    ConfigStore store(path);

    MutationOptions options;
    options.dry_run = true;
    auto changes = store.multiset({{"a", "2"}, {"a", "3"}}, options);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].old_value, Value(1));
    EXPECT_EQ(changes[1].old_value, Value(1));
    EXPECT_EQ(changes[1].new_value, 3);
    EXPECT_EQ(read_file(path), original);

    auto applied = store.multiset({{"a", "2"}, {"a", "3"}});
    ASSERT_EQ(applied.size(), 2u);
    EXPECT_EQ(applied[1].old_value, Value(1));
    EXPECT_EQ(store.get("a"), Value(3));
}

TEST_F(StoreTest, DryRunReportsFailures) {
    const std::string path = write("x: 1\n");
    ConfigStore store(path);

    MutationOptions options;
    options.dry_run = true;
    EXPECT_THROW(store.multiset({{"y[5]", "z"}}, options), BatchError);
    EXPECT_THROW(store.set("y[5]", "z", options), PathError);
}

// ============================================================================
// RULE S6: Missing files
// ============================================================================

TEST_F(StoreTest, MissingFileIsAnError) {
    const std::string path = dir.file("absent.yaml");
    ConfigStore store(path);

    EXPECT_THROW(store.get("a"), FileNotFoundError);
    EXPECT_THROW(store.set("a", 1), FileNotFoundError);
    EXPECT_THROW(store.multiset({{"a", "1"}}), FileNotFoundError);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(StoreTest, CreateMissingCreatesFile) {
    const std::string path = dir.file("created.yaml");
    ConfigStore store(path);

    MutationOptions options;
    options.create_missing = true;
    store.set("a.b", "c", options);

    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(store.get("a.b"), Value("c"));
}

TEST_F(StoreTest, EmptyFileIsEmptyMapping) {
    const std::string path = write("");
    ConfigStore store(path);
    EXPECT_EQ(store.get(""), Value::object());
}

TEST_F(StoreTest, InvalidYamlIsParseError) {
    const std::string path = write("a: [1, 2\n");
    ConfigStore store(path);
    EXPECT_THROW(store.get("a"), ParseError);
    EXPECT_THROW(store.set("a", 1), ParseError);
    EXPECT_EQ(read_file(path), "a: [1, 2\n");
}

// ============================================================================
// Reads
// ============================================================================

TEST_F(StoreTest, GetOrFallsBack) {
    const std::string path = write("a: 1\nn: null\n");
    ConfigStore store(path);

    EXPECT_EQ(store.get_or("a", 0), 1);
    EXPECT_EQ(store.get_or("b", "dflt"), "dflt");
    EXPECT_TRUE(store.get_or("n", "dflt").is_null());
}

TEST_F(StoreTest, MultigetWithDefaults) {
    const std::string path = write("a: 1\nb: {c: 2}\n");
    ConfigStore store(path);

    auto values = store.multiget({"b.c", "a", "b.c", "z"}, {{"z", "none"}});

    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0].first, "b.c");
    EXPECT_EQ(values[0].second, 2);
    EXPECT_EQ(values[1].first, "a");
    EXPECT_EQ(values[2].first, "z");
    EXPECT_EQ(values[2].second, "none");

    EXPECT_THROW(store.multiget({"a", "missing"}), NotFoundError);
}

TEST_F(StoreTest, ListFlattensSorted) {
    const std::string path = write("z: 1\ndb:\n  port: 5\n  host: h\nlist: [1, 2]\n");
    ConfigStore store(path);

    auto all = store.list();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].first, "db.host");
    EXPECT_EQ(all[1].first, "db.port");
    EXPECT_EQ(all[2].first, "list");
    EXPECT_EQ(all[3].first, "z");

    auto db = store.list("db");
    ASSERT_EQ(db.size(), 2u);
    EXPECT_EQ(db[0].first, "db.host");

    auto leaf = store.list("z");
    ASSERT_EQ(leaf.size(), 1u);
    EXPECT_EQ(leaf[0].second, 1);

    EXPECT_THROW(store.list("nope"), NotFoundError);
}

TEST_F(StoreTest, ValidateReportsSections) {
    const std::string path = write("zeta: 1\nalpha:\n  x: 1\n  y: [1, 2]\n");
    ConfigStore store(path);

    auto report = store.validate({"alpha.x", " zeta "});
    EXPECT_EQ(report.key_count, 3u);
    EXPECT_EQ(report.sections, (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(StoreTest, ValidateListsAllMissingKeys) {
    const std::string path = write("a: 1\n");
    ConfigStore store(path);

    try {
        store.validate({"a", "b", "c.d"});
        FAIL() << "Expected MissingKeysError";
    } catch (const MissingKeysError& e) {
        EXPECT_EQ(e.missing_keys(), (std::vector<std::string>{"b", "c.d"}));
    }
}

// ============================================================================
// Other formats
// ============================================================================

TEST_F(StoreTest, JsonFile) {
    const std::string path = write("{\"a\": {\"b\": 1}}", "cfg.json");
    ConfigStore store(path);
    EXPECT_EQ(store.format(), Format::Json);

    store.set("a.c", "x");
    store.push("a.list", 1);

    EXPECT_EQ(store.get("a"), Value({{"b", 1}, {"c", "x"}, {"list", {1}}}));
    EXPECT_EQ(read_file(path).front(), '{');
}

TEST_F(StoreTest, JsonInvalidUtf8LeavesFileAlone) {
    const std::string original = "{\"a\": 1}";
    const std::string path = write(original, "cfg.json");
    ConfigStore store(path);

    EXPECT_THROW(store.set("b", std::string("\xc3\x28")), StoreError);
    EXPECT_THROW(store.multiset({{"b", "\xff"}}), StoreError);
    EXPECT_EQ(read_file(path), original);
}

TEST_F(StoreTest, TomlFile) {
    const std::string path = write("[server]\nport = 80\n", "cfg.toml");
    ConfigStore store(path);
    EXPECT_EQ(store.format(), Format::Toml);

    store.set("server.port", 8080);
    EXPECT_EQ(store.get("server.port"), Value(8080));
}

// ============================================================================
// RULE S1: Locking
// ============================================================================

TEST_F(StoreTest, WriteWaitsForReaderLock) {
    const std::string path = write("a: 1\n");
    StoreOptions options;
    options.lock_timeout = 50ms;
    ConfigStore store(path, options);

    {
        FileLock reader(path, FileLock::Mode::Shared);
        EXPECT_THROW(store.set("a", 2), LockError);
        EXPECT_EQ(store.get("a"), Value(1));
    }
    store.set("a", 2);
    EXPECT_EQ(store.get("a"), Value(2));
}

TEST_F(StoreTest, ConcurrentPushesFromProcessesAreSerialized) {
    const std::string path = write("{}\n");
    constexpr int kWorkers = 4;
    constexpr int kPushesEach = 10;

    std::vector<pid_t> children;
    for (int w = 0; w < kWorkers; ++w) {
        const pid_t pid = ::fork();
        ASSERT_GE(pid, 0);
        if (pid == 0) {
            int status = 0;
            try {
                ConfigStore store(path);
                for (int i = 0; i < kPushesEach; ++i) {
                    store.push("events", w * 100 + i);
                }
            } catch (const StoreError&) {
                status = 1;
            }
            ::_exit(status);
        }
        children.push_back(pid);
    }

    for (pid_t pid : children) {
        int status = 0;
        ASSERT_EQ(::waitpid(pid, &status, 0), pid);
        EXPECT_TRUE(WIFEXITED(status));
        EXPECT_EQ(WEXITSTATUS(status), 0);
    }

    ConfigStore store(path);
    auto events = store.get("events");
    ASSERT_TRUE(events.has_value());
    EXPECT_EQ(events->size(), static_cast<size_t>(kWorkers * kPushesEach));
}

// ============================================================================
// Durability
// ============================================================================

TEST_F(StoreTest, AbortedWriteLeavesOriginal) {
    const std::string original = "a: 1  # one\n";
    const std::string path = write(original);
    StoreOptions options;
    options.write.before_commit = [](const std::string&) {
        throw std::runtime_error("power loss");
    };
    ConfigStore store(path, options);

    EXPECT_THROW(store.set("a", 2), std::runtime_error);
    EXPECT_EQ(read_file(path), original);

    // The lock is released after the failure
    FileLock probe(path, FileLock::Mode::Exclusive, 50ms);
    EXPECT_TRUE(probe.held());
}

// ============================================================================
// init
// ============================================================================

TEST_F(StoreTest, InitPlanningTemplate) {
    const std::string path = dir.file("sub/dir/config.yaml");

    InitResult result = ConfigStore::init(path);

    EXPECT_EQ(result.status, InitStatus::Created);
    EXPECT_EQ(result.key_count, 17u);
    ConfigStore store(path);
    EXPECT_EQ(store.get("helper.max_lines"), Value(2000));
    EXPECT_EQ(store.get("project.source_directory"), Value("src/"));
}

TEST_F(StoreTest, InitKeepsExistingFile) {
    const std::string path = write("mine: 1\n");

    InitResult result = ConfigStore::init(path, "minimal");

    EXPECT_EQ(result.status, InitStatus::Exists);
    EXPECT_EQ(result.key_count, 1u);
    EXPECT_EQ(read_file(path), "mine: 1\n");
}

TEST_F(StoreTest, InitForceOverwrites) {
    const std::string path = write("mine: 1\n");

    InitResult result = ConfigStore::init(path, "minimal", true);

    EXPECT_EQ(result.status, InitStatus::Created);
    EXPECT_EQ(result.key_count, 0u);
    ConfigStore store(path);
    EXPECT_EQ(store.get("config"), Value::object());
}

TEST_F(StoreTest, InitFromTemplateFile) {
    const std::string tmpl = write("# custom\nx: {y: 1}\n", "tmpl.yaml");
    const std::string path = dir.file("out.yaml");

    InitResult result = ConfigStore::init(path, tmpl);

    EXPECT_EQ(result.key_count, 1u);
    EXPECT_EQ(read_file(path), "# custom\nx: {y: 1}\n");
}

TEST_F(StoreTest, InitJsonTarget) {
    const std::string path = dir.file("config.json");
    ConfigStore::init(path, "minimal");
    ConfigStore store(path);
    EXPECT_EQ(store.get("config"), Value::object());
}

TEST_F(StoreTest, InitMissingTemplateFile) {
    EXPECT_THROW(ConfigStore::init(dir.file("out.yaml"), dir.file("nope.yaml")),
                 FileNotFoundError);
}
