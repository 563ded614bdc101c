// Test suite for swiftfs.
//
// Tests:
//   1. Segment addressing and write planning
//   2. Manifest references and /info URLs
//   3. DriverParameters / CliConfig parsing and validation
//   4. SwiftDriver writes against the local object store (chunk size 5)
//      - Segment layout of fresh writes, overwrites and gap writes
//      - Resumability, gap padding, tail preservation
//      - Segment size invariant, boundary offsets, empty writes
//      - Adoption of plain objects and directory markers
//   5. Range reads, stat, list, move
//   6. Recursive delete (per-object and bulk)
//   7. Failure injection
//   8. Metrics

#include "swiftfs/driver/segment_planner.hpp"
#include "swiftfs/driver/swift_driver.hpp"
#include "swiftfs/driver_config.hpp"
#include "swiftfs/metrics.hpp"
#include "swiftfs/storage/object_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace swiftfs;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

#define ASSERT_OK(err, msg)                                           \
    ASSERT_TRUE((err).ok(), std::string(msg) + ": " + (err).to_string())

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::string str(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

/// Write s at offset through write_stream.
static WriteResult write_at(StorageDriver& driver, const std::string& path,
                            uint64_t offset, const std::string& s) {
    std::istringstream in(s);
    return driver.write_stream(path, offset, in);
}

/// Whole content of path, or "<error: ...>".
static std::string content_of(StorageDriver& driver, const std::string& path) {
    auto result = driver.get_content(path);
    if (!result.error.ok()) return "<error: " + result.error.to_string() + ">";
    return str(result.data);
}

/// Sizes of the numbered segments of store name, in sequence order.
static std::vector<uint64_t> segment_sizes_of(const ObjectStore& store,
                                              const std::string& segments_container,
                                              const std::string& name) {
    std::vector<uint64_t> sizes;
    ListOptions options;
    options.prefix = segment_prefix_for(name);
    auto listing = store.list(segments_container, options);
    for (const auto& e : listing.entries) {
        if (parse_segment_sequence(options.prefix, e.name)) sizes.push_back(e.size);
    }
    return sizes;
}

static std::string sizes_str(const std::vector<uint64_t>& sizes) {
    std::string s;
    for (auto v : sizes) {
        if (!s.empty()) s += ",";
        s += std::to_string(v);
    }
    return s;
}

/// Every segment but the last is exactly chunk bytes, and the last is not empty.
static bool segments_well_formed(const std::vector<uint64_t>& sizes, uint64_t chunk) {
    for (size_t i = 0; i < sizes.size(); ++i) {
        if (i + 1 < sizes.size() && sizes[i] != chunk) return false;
        if (sizes[i] == 0 || sizes[i] > chunk) return false;
    }
    return true;
}

static DriverParameters test_params(const std::string& container = "test") {
    DriverParameters params;
    params.container = container;
    params.chunk_size = 5;
    return params;
}
/// Store wrapper that fails selected calls.
class FlakyStore : public ObjectStore {
public:
    explicit FlakyStore(std::unique_ptr<ObjectStore> inner) : inner_(std::move(inner)) {}

    // Fail the n-th segment PUT from now on (1-based); 0 disables
    int fail_segment_put = 0;
    bool fail_bulk_delete = false;
    // Delete primary-container objects, then report the bulk call as failed
    bool bulk_delete_partial = false;
    bool bulk_delete_supported = false;

    std::string type_name() const override { return "flaky"; }

    StoreResult create_container(const std::string& container) override {
        return inner_->create_container(container);
    }
    HeadResult head(const std::string& container, const std::string& name) const override {
        return inner_->head(container, name);
    }
    GetResult get(const std::string& container, const std::string& name,
                  const GetOptions& options) const override {
        return inner_->get(container, name, options);
    }
    PutResult put(const std::string& container, const std::string& name,
                  std::span<const uint8_t> data, const PutOptions& options) override {
        if (container.ends_with("_segments") && fail_segment_put > 0 && --fail_segment_put == 0) {
            PutResult result;
            result.status_code = 503;
            result.error_message = "injected failure";
            return result;
        }
        return inner_->put(container, name, data, options);
    }
    StoreResult remove(const std::string& container, const std::string& name) override {
        return inner_->remove(container, name);
    }
    BulkDeleteResult bulk_delete(const std::vector<ObjectPath>& objects) override {
        ++bulk_calls;
        if (bulk_delete_partial) {
            for (const auto& obj : objects) {
                if (!obj.container.ends_with("_segments")) inner_->remove(obj.container, obj.name);
            }
        }
        if (fail_bulk_delete || bulk_delete_partial) {
            BulkDeleteResult result;
            result.status_code = 502;
            result.error_message = "injected bulk failure";
            return result;
        }
        return inner_->bulk_delete(objects);
    }
    ListResult list(const std::string& container, const ListOptions& options) const override {
        return inner_->list(container, options);
    }
    StoreResult copy(const std::string& sc, const std::string& sn,
                     const std::string& dc, const std::string& dn) override {
        return inner_->copy(sc, sn, dc, dn);
    }
    StoreCapabilities capabilities() const override {
        StoreCapabilities caps;
        caps.bulk_delete = bulk_delete_supported;
        return caps;
    }

    int bulk_calls = 0;

private:
    std::unique_ptr<ObjectStore> inner_;
};

/// Temp directory removed when the test returns, failed or not.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

/// SwiftDriver over a fresh local store, plus a second handle for inspecting it.
struct DriverFixture {
    explicit DriverFixture(const DriverParameters& params = test_params(),
                           bool bulk_delete = false,
                           DriverMetrics* metrics = nullptr)
        : dir("swiftfs-driver"),
          driver(ObjectStoreFactory::create_local(dir.path(), bulk_delete), params, metrics),
          inspect(ObjectStoreFactory::create_local(dir.path())),
          seg(driver.segments_container()) {}

    TempDir dir;
    SwiftDriver driver;
    std::unique_ptr<ObjectStore> inspect;
    std::string seg;
};

// ---------------------------------------------------------------------------
// 1. Segment addressing and planning
// ---------------------------------------------------------------------------

static void test_segment_names_are_zero_padded() {
    TEST(segment_names_are_zero_padded);
    ASSERT_EQ(segment_name("a/b/", 1), std::string("a/b/0000000000000001"), "first segment");
    ASSERT_EQ(segment_name("x/", 123), std::string("x/0000000000000123"), "segment 123");
    ASSERT_TRUE(segment_name("x/", 9) < segment_name("x/", 10), "name order is sequence order");
    ASSERT_EQ(segments_container_for("reg"), std::string("reg_segments"), "segments container");
    ASSERT_EQ(segment_prefix_for("a/b"), std::string("a/b/"), "prefix has trailing slash");
    PASS();
}

static void test_parse_segment_sequence() {
    TEST(parse_segment_sequence);
    auto seq = parse_segment_sequence("a/", "a/0000000000000042");
    ASSERT_TRUE(seq.has_value(), "valid segment parses");
    ASSERT_EQ(*seq, 42u, "sequence");
    ASSERT_TRUE(!parse_segment_sequence("a/", "a/b/0000000000000001"), "child segment rejected");
    ASSERT_TRUE(!parse_segment_sequence("a/", "a/000000000000001"), "short number rejected");
    ASSERT_TRUE(!parse_segment_sequence("a/", "a/00000000000000x1"), "non-digit rejected");
    ASSERT_TRUE(!parse_segment_sequence("a/", "a/0000000000000000"), "sequence 0 rejected");
    ASSERT_TRUE(!parse_segment_sequence("a/", "ab/0000000000000001"), "other object rejected");
    PASS();
}

static void test_plan_overwrite_inside_first_segment() {
    TEST(plan_overwrite_inside_first_segment);
    std::vector<uint64_t> sizes = {5, 5};
    auto plan = plan_write(3, 10, 5, sizes);
    ASSERT_EQ(plan.first_sequence, 1u, "first sequence");
    ASSERT_EQ(plan.padding_segments, 0u, "no padding");
    ASSERT_EQ(plan.data_sequence, 1u, "data sequence");
    ASSERT_EQ(plan.prefix_length(3), 3u, "prefix");
    PASS();
}

static void test_plan_offset_on_chunk_boundary() {
    TEST(plan_offset_on_chunk_boundary);
    std::vector<uint64_t> sizes = {5, 5};
    auto plan = plan_write(5, 10, 5, sizes);
    ASSERT_EQ(plan.data_sequence, 2u, "offset 5 starts segment 2");
    ASSERT_EQ(plan.data_cursor, 5u, "cursor");
    ASSERT_EQ(plan.prefix_length(5), 0u, "no prefix");

    plan = plan_write(10, 10, 5, sizes);
    ASSERT_EQ(plan.data_sequence, 3u, "offset 10 starts segment 3");
    ASSERT_EQ(plan.padding_segments, 0u, "no padding at end of data");
    PASS();
}

static void test_plan_gap_on_empty_object() {
    TEST(plan_gap_on_empty_object);
    auto plan = plan_write(12, 0, 5, {});
    ASSERT_EQ(plan.first_sequence, 1u, "padding starts at 1");
    ASSERT_EQ(plan.padding_segments, 2u, "two zero segments");
    ASSERT_EQ(plan.data_sequence, 3u, "data in segment 3");
    ASSERT_EQ(plan.data_cursor, 10u, "segment 3 starts at 10");
    ASSERT_EQ(plan.prefix_length(12), 2u, "two zero bytes before data");
    PASS();
}

static void test_plan_append_after_short_segment() {
    TEST(plan_append_after_short_segment);
    std::vector<uint64_t> sizes = {5, 3};
    auto plan = plan_write(8, 8, 5, sizes);
    ASSERT_EQ(plan.data_sequence, 2u, "short segment is rewritten");
    ASSERT_EQ(plan.data_cursor, 5u, "cursor");
    ASSERT_EQ(plan.prefix_length(8), 3u, "old bytes kept");

    plan = plan_write(14, 8, 5, sizes);
    ASSERT_EQ(plan.first_sequence, 2u, "padding completes segment 2");
    ASSERT_EQ(plan.padding_segments, 1u, "one padding segment");
    ASSERT_EQ(plan.data_sequence, 3u, "data in segment 3");
    ASSERT_EQ(plan.prefix_length(14), 4u, "four zero bytes before data");
    PASS();
}

// ---------------------------------------------------------------------------
// 2. Manifest references and /info URLs
// ---------------------------------------------------------------------------

static void test_manifest_ref_round_trip() {
    TEST(manifest_ref_round_trip);
    auto ref = ManifestRef::parse("reg_segments/docker/blobs/x/");
    ASSERT_TRUE(ref.has_value(), "should parse");
    ASSERT_EQ(ref->container, std::string("reg_segments"), "container");
    ASSERT_EQ(ref->prefix, std::string("docker/blobs/x/"), "prefix");
    ASSERT_EQ(ref->to_header(), std::string("reg_segments/docker/blobs/x/"), "header");
    ASSERT_TRUE(!ManifestRef::parse("nocontainer"), "no slash rejected");
    ASSERT_TRUE(!ManifestRef::parse("/prefix"), "empty container rejected");
    PASS();
}

static void test_swift_info_url_strips_two_components() {
    TEST(swift_info_url_strips_two_components);
    ASSERT_EQ(swift_info_url("https://swift.example.com/v1/AUTH_test"),
              std::string("https://swift.example.com/info"), "storage url");
    ASSERT_EQ(swift_info_url("http://proxy:8080/auth/v1.0/"),
              std::string("http://proxy:8080/info"), "tempauth url");
    ASSERT_EQ(swift_info_url("http://keystone:5000/v3"),
              std::string("http://keystone:5000/info"), "floored at host");
    ASSERT_EQ(swift_info_url("http://h/a/b/c"), std::string("http://h/a/info"), "deep path");
    PASS();
}

static void test_factory_rejects_unknown_type() {
    TEST(factory_rejects_unknown_type);
    bool threw = false;
    try {
        ObjectStoreFactory::create("ftp", {});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "unknown type should throw");
    PASS();
}

static void test_local_store_range_past_end_is_416() {
    TEST(local_store_range_past_end_is_416);
    TempDir dir("swiftfs-local");
    auto store = ObjectStoreFactory::create("local", {{"path", dir.path().string()}});
    ASSERT_TRUE(store->create_container("c").success, "create container");
    auto data = bytes("hello");
    ASSERT_TRUE(store->put("c", "o", data).success, "put");
    GetOptions options;
    options.range_start = 5;
    auto got = store->get("c", "o", options);
    ASSERT_EQ(got.status_code, 416, "range at end");
    options.range_start = 1;
    got = store->get("c", "o", options);
    ASSERT_EQ(str(got.data), std::string("ello"), "range from 1");
    PASS();
}

// ---------------------------------------------------------------------------
// 3. Configuration
// ---------------------------------------------------------------------------

static void test_apply_map_and_validate() {
    TEST(apply_map_and_validate);
    DriverParameters params;
    auto err = params.apply_map({
        {"username", "u"}, {"password", "p"}, {"authurl", "http://ks:5000/v3"},
        {"container", "reg"}, {"prefix", "/docker"}, {"insecureskipverify", "true"},
        {"chunksize", "2097152"}, {"region", "r1"},
    });
    ASSERT_EMPTY(err, "apply_map");
    ASSERT_EQ(params.chunk_size, 2097152u, "chunk size");
    ASSERT_TRUE(params.insecure_skip_verify, "insecure flag");
    ASSERT_EMPTY(params.validate(), "valid parameters");
    ASSERT_EQ(params.store_params().at("authurl"), std::string("http://ks:5000/v3"), "store params");
    PASS();
}

static void test_chunk_size_floor() {
    TEST(chunk_size_floor);
    DriverParameters params;
    params.container = "reg";
    ASSERT_EQ(params.chunk_size, constants::DEFAULT_CHUNK_SIZE, "default chunk size");
    params.chunk_size = constants::MIN_CHUNK_SIZE - 1;
    auto err = params.validate(false);
    ASSERT_TRUE(err.find("chunksize") != std::string::npos, "below minimum rejected");
    params.chunk_size = constants::MIN_CHUNK_SIZE;
    ASSERT_EMPTY(params.validate(false), "minimum accepted");
    PASS();
}

static void test_required_parameters() {
    TEST(required_parameters);
    DriverParameters params;
    ASSERT_TRUE(params.validate().find("username") != std::string::npos, "username required");
    ASSERT_TRUE(params.validate(false).find("container") != std::string::npos,
                "container required");
    PASS();
}

static void test_bad_parameters_rejected() {
    TEST(bad_parameters_rejected);
    DriverParameters params;
    ASSERT_NOT_EMPTY(params.apply_map({{"chunksize", "lots"}}), "non-numeric chunk size");
    ASSERT_NOT_EMPTY(params.apply_map({{"chunksize", "12k"}}), "trailing garbage");
    ASSERT_NOT_EMPTY(params.apply_map({{"bucket", "x"}}), "unknown key");
    PASS();
}

static void test_cli_args() {
    TEST(cli_args);
    const char* args[] = {
        "swiftfs", "--local-root", "/tmp/store", "--container", "c",
        "--chunksize", "1048576", "--verbose", "write", "/a/b", "10",
    };
    auto config = CliConfig::from_args(11, const_cast<char**>(args));
    ASSERT_TRUE(config.has_value(), "should parse");
    ASSERT_EQ(config->backend, std::string("local"), "backend");
    ASSERT_EQ(config->driver.container, std::string("c"), "container");
    ASSERT_EQ(config->command, std::string("write"), "command");
    ASSERT_EQ(config->args.size(), 2u, "args");
    ASSERT_TRUE(config->verbose, "verbose");
    ASSERT_EMPTY(config->validate(), "valid");
    PASS();
}

static void test_cli_unknown_option() {
    TEST(cli_unknown_option);
    const char* args[] = {"swiftfs", "--bogus", "ls"};
    auto config = CliConfig::from_args(3, const_cast<char**>(args));
    ASSERT_TRUE(!config.has_value(), "unknown option rejected");
    PASS();
}

static void test_json_config() {
    TEST(json_config);
    TempDir dir("swiftfs-config");
    auto path = dir.path() / "swiftfs.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"authurl": "http://ks/v2.0", "username": "u", "password": "p",
                  "container": "reg", "chunksize": 4194304, "insecureskipverify": true,
                  "metrics_file": "/tmp/swiftfs.prom"})";
    }
    CliConfig config;
    ASSERT_TRUE(config.load_json(path), "load_json");
    ASSERT_EQ(config.driver.chunk_size, 4194304u, "numeric chunk size");
    ASSERT_TRUE(config.driver.insecure_skip_verify, "boolean flag");
    ASSERT_EQ(config.metrics_file.string(), std::string("/tmp/swiftfs.prom"), "metrics file");
    config.command = "ls";
    ASSERT_EMPTY(config.validate(), "valid");
    PASS();
}

// ---------------------------------------------------------------------------
// 4. Driver writes
// ---------------------------------------------------------------------------

static void test_fresh_write_creates_manifest_and_segments() {
    TEST(fresh_write_creates_manifest_and_segments);
    DriverFixture fx;
    auto r = write_at(fx.driver, "/f", 0, "ABCDEFGHIJ");
    ASSERT_OK(r.error, "write");
    ASSERT_EQ(r.bytes_written, 10u, "bytes written");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "f")), std::string("5,5"), "two segments");
    auto head = fx.inspect->head("test", "f");
    ASSERT_TRUE(head.success && head.metadata.manifest.has_value(), "manifest present");
    ASSERT_EQ(head.metadata.manifest->to_header(), std::string("test_segments/f/"), "manifest ref");
    auto st = fx.driver.stat("/f");
    ASSERT_OK(st.error, "stat");
    ASSERT_EQ(st.info.size, 10u, "stat size");
    ASSERT_TRUE(!st.info.is_dir, "not a directory");
    PASS();
}

static void test_overwrite_inside_segment() {
    TEST(overwrite_inside_segment);
    DriverFixture fx;
    ASSERT_OK(write_at(fx.driver, "/f", 0, "ABCDEFGHIJ").error, "initial write");
    auto r = write_at(fx.driver, "/f", 3, "xy");
    ASSERT_OK(r.error, "write");
    ASSERT_EQ(r.bytes_written, 2u, "bytes written");
    auto s1 = fx.inspect->get(fx.seg, segment_name("f/", 1));
    auto s2 = fx.inspect->get(fx.seg, segment_name("f/", 2));
    ASSERT_EQ(str(s1.data), std::string("ABCxy"), "segment 1");
    ASSERT_EQ(str(s2.data), std::string("FGHIJ"), "segment 2 unchanged");
    ASSERT_EQ(content_of(fx.driver, "/f"), std::string("ABCxyFGHIJ"), "content");
    PASS();
}

static void test_write_past_end_of_empty_object() {
    TEST(write_past_end_of_empty_object);
    DriverFixture fx;
    auto r = write_at(fx.driver, "/z", 12, "Z");
    ASSERT_OK(r.error, "write");
    ASSERT_EQ(r.bytes_written, 1u, "only caller bytes counted");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "z")), std::string("5,5,3"), "segments");
    ASSERT_EQ(content_of(fx.driver, "/z"), std::string(12, '\0') + "Z", "content");
    ASSERT_EQ(fx.driver.stat("/z").info.size, 13u, "stat size");
    PASS();
}

static void test_resumability() {
    TEST(resumability);
    DriverFixture fx;
    const std::string data = "The quick brown fox jumps";
    for (size_t k = 0; k <= data.size(); ++k) {
        auto path = "/resume/k" + std::to_string(k);
        auto r1 = write_at(fx.driver, path, 0, data.substr(0, k));
        ASSERT_OK(r1.error, "first write");
        ASSERT_EQ(r1.bytes_written, k, "first write count");
        auto r2 = write_at(fx.driver, path, k, data.substr(k));
        ASSERT_OK(r2.error, "second write");
        ASSERT_EQ(r2.bytes_written, data.size() - k, "second write count");
        ASSERT_EQ(content_of(fx.driver, path), data, "content at split " + std::to_string(k));
        auto sizes = segment_sizes_of(*fx.inspect, fx.seg, "resume/k" + std::to_string(k));
        ASSERT_TRUE(segments_well_formed(sizes, 5), "segment sizes " + sizes_str(sizes));
    }
    PASS();
}

static void test_gap_padding() {
    TEST(gap_padding);
    DriverFixture fx;
    ASSERT_OK(write_at(fx.driver, "/gap", 0, "1234567").error, "initial write");
    ASSERT_OK(write_at(fx.driver, "/gap", 16, "hello").error, "gap write");
    std::string expected = "1234567" + std::string(9, '\0') + "hello";
    ASSERT_EQ(content_of(fx.driver, "/gap"), expected, "zeros in gap");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "gap")), std::string("5,5,5,5,1"),
              "short segment completed");
    PASS();
}

static void test_tail_preservation() {
    TEST(tail_preservation);
    DriverFixture fx;
    const std::string data = "abcdefghijklmnopqrstuvw";
    ASSERT_OK(write_at(fx.driver, "/tail", 0, data).error, "initial write");
    ASSERT_OK(write_at(fx.driver, "/tail", 6, "XYZ").error, "middle overwrite");
    ASSERT_EQ(content_of(fx.driver, "/tail"), std::string("abcdefXYZjklmnopqrstuvw"), "content");
    ASSERT_OK(write_at(fx.driver, "/tail", 8, "12345").error, "overwrite across boundary");
    ASSERT_EQ(content_of(fx.driver, "/tail"), std::string("abcdefXY12345nopqrstuvw"), "content");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "tail")), std::string("5,5,5,5,3"),
              "segment layout unchanged");
    PASS();
}

static void test_boundary_offsets() {
    TEST(boundary_offsets);
    DriverFixture fx;
    ASSERT_OK(write_at(fx.driver, "/edge", 0, "0123456789").error, "initial write");
    ASSERT_OK(write_at(fx.driver, "/edge", 5, "ab").error, "write at 5");
    ASSERT_EQ(content_of(fx.driver, "/edge"), std::string("01234ab789"), "offset 5");
    ASSERT_OK(write_at(fx.driver, "/edge", 10, "cd").error, "write at 10");
    ASSERT_EQ(content_of(fx.driver, "/edge"), std::string("01234ab789cd"), "offset 10");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "edge")), std::string("5,5,2"), "layout");
    ASSERT_OK(write_at(fx.driver, "/edge", 15, "e").error, "write at 15");
    ASSERT_EQ(content_of(fx.driver, "/edge"), std::string("01234ab789cd") + std::string(3, '\0') + "e",
              "offset 15");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "edge")), std::string("5,5,5,1"), "layout");
    PASS();
}

static void test_append_after_short_segment() {
    TEST(append_after_short_segment);
    DriverFixture fx;
    ASSERT_OK(write_at(fx.driver, "/app", 0, "12345678").error, "initial write");
    ASSERT_OK(write_at(fx.driver, "/app", 8, "9abc").error, "append");
    ASSERT_EQ(content_of(fx.driver, "/app"), std::string("123456789abc"), "content");
    auto sizes = segment_sizes_of(*fx.inspect, fx.seg, "app");
    ASSERT_EQ(sizes_str(sizes), std::string("5,5,2"), "segment size invariant");
    PASS();
}

static void test_empty_write_inside_data_changes_nothing() {
    TEST(empty_write_inside_data_changes_nothing);
    DriverFixture fx;
    ASSERT_OK(write_at(fx.driver, "/app", 0, "123456789abc").error, "initial write");
    auto r = write_at(fx.driver, "/app", 4, "");
    ASSERT_OK(r.error, "empty write");
    ASSERT_EQ(r.bytes_written, 0u, "nothing written");
    ASSERT_EQ(content_of(fx.driver, "/app"), std::string("123456789abc"), "content unchanged");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "app")), std::string("5,5,2"),
              "layout unchanged");

    r = write_at(fx.driver, "/app", 12, "");
    ASSERT_OK(r.error, "empty write at end");
    ASSERT_EQ(fx.driver.stat("/app").info.size, 12u, "size unchanged at end of data");
    PASS();
}

static void test_empty_write_past_end_extends_with_zeros() {
    TEST(empty_write_past_end_extends_with_zeros);
    DriverFixture fx;

    // Gap on an empty object ending inside a chunk
    auto r = write_at(fx.driver, "/hole", 12, "");
    ASSERT_OK(r.error, "empty write at 12");
    ASSERT_EQ(r.bytes_written, 0u, "no caller bytes");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "hole")), std::string("5,5,2"),
              "partial zero segment written");
    ASSERT_EQ(content_of(fx.driver, "/hole"), std::string(12, '\0'), "zeros up to offset");
    ASSERT_EQ(fx.driver.stat("/hole").info.size, 12u, "stat size");

    // Gap after a short terminal segment
    ASSERT_OK(write_at(fx.driver, "/short", 0, "1234567").error, "initial write");
    r = write_at(fx.driver, "/short", 9, "");
    ASSERT_OK(r.error, "empty write at 9");
    ASSERT_EQ(r.bytes_written, 0u, "no caller bytes");
    ASSERT_EQ(sizes_str(segment_sizes_of(*fx.inspect, fx.seg, "short")), std::string("5,4"),
              "short segment extended");
    ASSERT_EQ(content_of(fx.driver, "/short"), std::string("1234567") + std::string(2, '\0'),
              "old bytes then zeros");
    PASS();
}

static void test_adopt_plain_object() {
    TEST(adopt_plain_object);
    DriverFixture fx;
    ASSERT_OK(fx.driver.put_content("/plain", bytes("hello")), "put_content");
    auto head = fx.inspect->head("test", "plain");
    ASSERT_TRUE(head.success && !head.metadata.manifest, "stored whole");
    ASSERT_OK(write_at(fx.driver, "/plain", 5, " world").error, "append");
    ASSERT_EQ(content_of(fx.driver, "/plain"), std::string("hello world"), "content");
    head = fx.inspect->head("test", "plain");
    ASSERT_TRUE(head.metadata.manifest.has_value(), "now a manifest");
    PASS();
}

static void test_adopt_directory_marker() {
    TEST(adopt_directory_marker);
    DriverFixture fx;
    ASSERT_OK(fx.driver.put_content("/dirx/f", bytes("x")), "put_content");
    ASSERT_TRUE(fx.driver.stat("/dirx").info.is_dir, "marker created");
    ASSERT_OK(write_at(fx.driver, "/dirx", 0, "abc").error, "write over marker");
    auto st = fx.driver.stat("/dirx");
    ASSERT_OK(st.error, "stat");
    ASSERT_TRUE(!st.info.is_dir, "file after write");
    ASSERT_EQ(st.info.size, 3u, "stat size");
    ASSERT_EQ(content_of(fx.driver, "/dirx"), std::string("abc"), "content");
    auto head = fx.inspect->head("test", "dirx");
    ASSERT_EQ(head.metadata.content_type, std::string(constants::DEFAULT_CONTENT_TYPE), "content type");
    ASSERT_EQ(content_of(fx.driver, "/dirx/f"), std::string("x"), "child kept");
    PASS();
}

static void test_put_content_replaces_manifest() {
    TEST(put_content_replaces_manifest);
    DriverFixture fx;
    ASSERT_OK(write_at(fx.driver, "/plain", 0, "hello world").error, "segmented write");
    ASSERT_OK(fx.driver.put_content("/plain", bytes("small")), "put_content");
    ASSERT_EQ(content_of(fx.driver, "/plain"), std::string("small"), "content");
    ASSERT_TRUE(segment_sizes_of(*fx.inspect, fx.seg, "plain").empty(), "old segments collected");
    PASS();
}

static void test_stale_segments_purged_on_create() {
    TEST(stale_segments_purged_on_create);
    DriverFixture fx;
    auto stale = bytes("STALE");
    fx.inspect->put(fx.seg, segment_name("fresh/", 1), stale);
    fx.inspect->put(fx.seg, segment_name("fresh/", 2), stale);
    ASSERT_OK(write_at(fx.driver, "/fresh", 0, "new").error, "write");
    ASSERT_EQ(content_of(fx.driver, "/fresh"), std::string("new"), "stale bytes not concatenated");
    PASS();
}

// ---------------------------------------------------------------------------
// 5. Driver reads and metadata
// ---------------------------------------------------------------------------

static DriverParameters prefixed_params() {
    auto params = test_params();
    params.prefix = "/registry/";
    return params;
}

/// /d/a segmented (12 bytes) and /d/b/c stored whole.
static bool seed_directory_tree(SwiftDriver& driver) {
    return write_at(driver, "/d/a", 0, "0123456789AB").error.ok() &&
           driver.put_content("/d/b/c", bytes("nested")).ok();
}

static void test_prefix_applied_to_store_names() {
    TEST(prefix_applied_to_store_names);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(seed_directory_tree(fx.driver), "setup");
    ASSERT_EQ(fx.driver.store_name("/d/a"), std::string("registry/d/a"), "store name");
    ASSERT_EQ(fx.driver.logical_path("registry/d/a"), std::string("/d/a"), "logical path");
    ASSERT_TRUE(fx.inspect->head("test", "registry/d/a").success, "object under prefix");
    PASS();
}

static void test_read_stream_from_offset() {
    TEST(read_stream_from_offset);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(seed_directory_tree(fx.driver), "setup");
    auto r = fx.driver.read_stream("/d/a", 4);
    ASSERT_OK(r.error, "read_stream");
    std::string s((std::istreambuf_iterator<char>(*r.stream)), std::istreambuf_iterator<char>());
    ASSERT_EQ(s, std::string("456789AB"), "tail content");
    PASS();
}

static void test_read_stream_at_or_after_end_is_empty() {
    TEST(read_stream_at_or_after_end_is_empty);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(seed_directory_tree(fx.driver), "setup");
    for (uint64_t offset : {12u, 100u}) {
        auto r = fx.driver.read_stream("/d/a", offset);
        ASSERT_OK(r.error, "read_stream at " + std::to_string(offset));
        ASSERT_TRUE(r.stream && r.stream->peek() == std::char_traits<char>::eof(), "empty stream");
    }
    PASS();
}

static void test_missing_paths_are_not_found() {
    TEST(missing_paths_are_not_found);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(fx.driver.get_content("/nope").error.code == DriverErrorCode::PathNotFound, "get");
    ASSERT_TRUE(fx.driver.read_stream("/nope", 0).error.code == DriverErrorCode::PathNotFound, "read");
    ASSERT_TRUE(fx.driver.stat("/nope").error.code == DriverErrorCode::PathNotFound, "stat");
    ASSERT_TRUE(fx.driver.remove("/nope").code == DriverErrorCode::PathNotFound, "remove");
    PASS();
}

static void test_invalid_paths_rejected() {
    TEST(invalid_paths_rejected);
    DriverFixture fx(prefixed_params());
    for (const char* p : {"", "/", "a/b", "/a//b", "/a/", "/a b", "/a?b"}) {
        ASSERT_TRUE(fx.driver.stat(p).error.code == DriverErrorCode::InvalidPath,
                    std::string("stat ") + p);
    }
    ASSERT_TRUE(is_valid_path("/a.b/c_d-e/F9"), "valid characters");
    PASS();
}

static void test_url_for_unsupported() {
    TEST(url_for_unsupported);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(seed_directory_tree(fx.driver), "setup");
    auto r = fx.driver.url_for("/d/a");
    ASSERT_TRUE(r.error.code == DriverErrorCode::Unsupported, "unsupported");
    ASSERT_EQ(fx.driver.name(), std::string("swift"), "driver name");
    PASS();
}

static void test_directories_and_listing() {
    TEST(directories_and_listing);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(seed_directory_tree(fx.driver), "setup");
    auto st = fx.driver.stat("/d");
    ASSERT_OK(st.error, "stat dir");
    ASSERT_TRUE(st.info.is_dir, "directory marker");
    auto top = fx.driver.list("/");
    ASSERT_OK(top.error, "list root");
    ASSERT_EQ(top.paths.size(), 1u, "one entry at root");
    ASSERT_EQ(top.paths[0], std::string("/d"), "root entry");
    auto l = fx.driver.list("/d");
    ASSERT_OK(l.error, "list /d");
    ASSERT_EQ(l.paths.size(), 2u, "two children");
    ASSERT_EQ(l.paths[0], std::string("/d/a"), "file child");
    ASSERT_EQ(l.paths[1], std::string("/d/b"), "directory child");
    auto empty = fx.driver.list("/d/a");
    ASSERT_OK(empty.error, "list of a file");
    ASSERT_TRUE(empty.paths.empty(), "no children");
    PASS();
}

static void test_move_segmented_object() {
    TEST(move_segmented_object);
    DriverFixture fx(prefixed_params());
    ASSERT_TRUE(seed_directory_tree(fx.driver), "setup");
    ASSERT_OK(fx.driver.move("/d/a", "/e/moved"), "move");
    ASSERT_EQ(content_of(fx.driver, "/e/moved"), std::string("0123456789AB"), "content moved");
    ASSERT_TRUE(fx.driver.stat("/d/a").error.code == DriverErrorCode::PathNotFound, "source gone");
    ASSERT_TRUE(segment_sizes_of(*fx.inspect, fx.seg, "registry/d/a").empty(),
                "source segments collected");
    ASSERT_TRUE(fx.driver.stat("/e").info.is_dir, "destination parent created");
    ASSERT_TRUE(fx.driver.move("/d/a", "/x").code == DriverErrorCode::PathNotFound, "missing source");
    PASS();
}

// ---------------------------------------------------------------------------
// 6. Recursive delete
// ---------------------------------------------------------------------------

static bool populate_tree(SwiftDriver& driver) {
    return write_at(driver, "/t/big", 0, "0123456789abcdefghij").error.ok() &&
           write_at(driver, "/t/sub/big2", 0, "ABCDEFGHIJKLM").error.ok() &&
           driver.put_content("/t/small", bytes("s")).ok() &&
           driver.put_content("/tx/keep", bytes("keep")).ok() &&
           write_at(driver, "/tx/keepbig", 0, "0123456789").error.ok();
}

/// Nothing of /t is left while /tx survives. Ends the test.
static void check_tree_removed(SwiftDriver& driver, const ObjectStore& inspect) {
    ListOptions options;
    options.prefix = "t/";
    auto segs = inspect.list(driver.segments_container(), options);
    ASSERT_TRUE(segs.success && segs.entries.empty(), "no segments left under t/");
    auto objs = inspect.list(driver.container(), options);
    ASSERT_TRUE(objs.success && objs.entries.empty(), "no objects left under t/");
    ASSERT_TRUE(!inspect.head(driver.container(), "t").success, "t itself removed");
    ASSERT_TRUE(driver.get_content("/t/big").error.code == DriverErrorCode::PathNotFound, "get after delete");
    ASSERT_EQ(content_of(driver, "/tx/keep"), std::string("keep"), "sibling with shared prefix kept");
    ASSERT_EQ(content_of(driver, "/tx/keepbig"), std::string("0123456789"), "sibling segments kept");
    ASSERT_TRUE(driver.remove("/t").code == DriverErrorCode::PathNotFound, "second delete");
    PASS();
}

static void test_per_object_delete() {
    TEST(per_object_delete);
    DriverFixture fx;
    ASSERT_TRUE(!fx.driver.bulk_delete_supported(), "bulk disabled");
    ASSERT_TRUE(populate_tree(fx.driver), "setup");
    ASSERT_OK(fx.driver.remove("/t"), "remove");
    check_tree_removed(fx.driver, *fx.inspect);
}

static void test_bulk_delete_covers_segments() {
    TEST(bulk_delete_covers_segments);
    DriverFixture fx(test_params(), true);
    ASSERT_TRUE(fx.driver.bulk_delete_supported(), "bulk enabled");
    ASSERT_TRUE(populate_tree(fx.driver), "setup");
    ASSERT_OK(fx.driver.remove("/t"), "remove");
    check_tree_removed(fx.driver, *fx.inspect);
}

static void test_bulk_failure_falls_back() {
    TEST(bulk_failure_falls_back);
    TempDir dir("swiftfs-fallback");
    auto flaky = std::make_unique<FlakyStore>(ObjectStoreFactory::create_local(dir.path(), true));
    flaky->bulk_delete_supported = true;
    flaky->fail_bulk_delete = true;
    auto* flaky_ptr = flaky.get();
    SwiftDriver driver(std::move(flaky), test_params());
    auto inspect = ObjectStoreFactory::create_local(dir.path());
    ASSERT_TRUE(populate_tree(driver), "setup");
    ASSERT_OK(driver.remove("/t"), "remove");
    ASSERT_EQ(flaky_ptr->bulk_calls, 1, "bulk attempted once");
    check_tree_removed(driver, *inspect);
}

static void test_partial_bulk_failure_sweeps_segments() {
    TEST(partial_bulk_failure_sweeps_segments);
    TempDir dir("swiftfs-partial");
    auto flaky = std::make_unique<FlakyStore>(ObjectStoreFactory::create_local(dir.path(), true));
    flaky->bulk_delete_supported = true;
    flaky->bulk_delete_partial = true;
    SwiftDriver driver(std::move(flaky), test_params());
    auto inspect = ObjectStoreFactory::create_local(dir.path());
    ASSERT_TRUE(populate_tree(driver), "setup");
    ASSERT_OK(driver.remove("/t"), "remove");
    check_tree_removed(driver, *inspect);
}

// ---------------------------------------------------------------------------
// 7. Failure handling
// ---------------------------------------------------------------------------

static void test_resume_after_failed_segment_put() {
    TEST(resume_after_failed_segment_put);
    TempDir dir("swiftfs-flaky");
    auto flaky = std::make_unique<FlakyStore>(ObjectStoreFactory::create_local(dir.path()));
    auto* flaky_ptr = flaky.get();
    SwiftDriver driver(std::move(flaky), test_params());

    const std::string data = "abcdefghijklmnopqrstuvw";
    flaky_ptr->fail_segment_put = 3;
    auto r = write_at(driver, "/flaky", 0, data);
    ASSERT_TRUE(r.error.code == DriverErrorCode::Remote, "remote error");
    ASSERT_EQ(r.error.status_code, 503, "status kept");
    ASSERT_EQ(r.bytes_written, 10u, "committed bytes only");
    ASSERT_EQ(content_of(driver, "/flaky"), data.substr(0, 10), "committed prefix readable");

    r = write_at(driver, "/flaky", r.bytes_written, data.substr(r.bytes_written));
    ASSERT_OK(r.error, "resumed write");
    ASSERT_EQ(content_of(driver, "/flaky"), data, "content after resume");
    PASS();
}

static void test_failed_padding_reports_zero_bytes() {
    TEST(failed_padding_reports_zero_bytes);
    TempDir dir("swiftfs-pad");
    auto flaky = std::make_unique<FlakyStore>(ObjectStoreFactory::create_local(dir.path()));
    auto* flaky_ptr = flaky.get();
    SwiftDriver driver(std::move(flaky), test_params());

    flaky_ptr->fail_segment_put = 2;
    auto r = write_at(driver, "/pad", 12, "Z");
    ASSERT_TRUE(!r.error.ok(), "error reported");
    ASSERT_EQ(r.bytes_written, 0u, "no caller bytes committed");
    r = write_at(driver, "/pad", 12, "Z");
    ASSERT_OK(r.error, "retry");
    ASSERT_EQ(content_of(driver, "/pad"), std::string(12, '\0') + "Z", "content after retry");
    PASS();
}

static void test_failed_trailing_zero_segment_is_reported() {
    TEST(failed_trailing_zero_segment_is_reported);
    TempDir dir("swiftfs-zeros");
    auto flaky = std::make_unique<FlakyStore>(ObjectStoreFactory::create_local(dir.path()));
    auto* flaky_ptr = flaky.get();
    SwiftDriver driver(std::move(flaky), test_params());

    // Segments 1 and 2 are padding, segment 3 holds the last two zeros
    flaky_ptr->fail_segment_put = 3;
    auto r = write_at(driver, "/hole", 12, "");
    ASSERT_TRUE(r.error.code == DriverErrorCode::Remote, "remote error");
    ASSERT_EQ(driver.stat("/hole").info.size, 10u, "full padding segments kept");
    r = write_at(driver, "/hole", 12, "");
    ASSERT_OK(r.error, "retry");
    ASSERT_EQ(content_of(driver, "/hole"), std::string(12, '\0'), "content after retry");
    PASS();
}

static void test_constructor_rejects_missing_container() {
    TEST(constructor_rejects_missing_container);
    TempDir dir("swiftfs-ctor");
    bool threw = false;
    try {
        SwiftDriver driver(ObjectStoreFactory::create_local(dir.path()), test_params(""));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "empty container should throw");
    PASS();
}

// ---------------------------------------------------------------------------
// 8. Metrics
// ---------------------------------------------------------------------------

static void test_operations_counted() {
    TEST(operations_counted);
    DriverMetrics metrics({{"container", "test"}});
    DriverFixture fx(test_params(), false, &metrics);
    write_at(fx.driver, "/m", 12, "Z");
    fx.driver.get_content("/missing");
    auto text = metrics.serialize();
    ASSERT_TRUE(text.find("swiftfs_operations_total") != std::string::npos, "operations family");
    ASSERT_TRUE(text.find("operation=\"write_stream\"") != std::string::npos, "write_stream label");
    ASSERT_TRUE(text.find("result=\"failure\"") != std::string::npos, "failure label");
    ASSERT_TRUE(text.find("swiftfs_operation_duration_seconds") != std::string::npos, "histogram");
    ASSERT_EQ(metrics.padding_segments().Value(), 2.0, "padding segments");
    ASSERT_EQ(metrics.bytes_written().Value(), 1.0, "caller bytes");
    PASS();
}

static void test_write_prom_file() {
    TEST(write_prom_file);
    DriverMetrics metrics({{"container", "test"}});
    DriverFixture fx(test_params(), false, &metrics);
    ASSERT_OK(write_at(fx.driver, "/m", 0, "abc").error, "write");
    auto prom = fx.dir.path() / "swiftfs.prom";
    ASSERT_TRUE(metrics.write_file(prom), "write_file");
    std::ifstream ifs(prom);
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    ASSERT_TRUE(content.find("swiftfs_segments_written_total") != std::string::npos, "segments counter");
    ASSERT_TRUE(content.find("container=\"test\"") != std::string::npos, "constant label");
    PASS();
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "swiftfs test suite" << std::endl;
    std::cout << "==================" << std::endl;

    std::cout << "\n=== Segment planner ===" << std::endl;
    test_segment_names_are_zero_padded();
    test_parse_segment_sequence();
    test_plan_overwrite_inside_first_segment();
    test_plan_offset_on_chunk_boundary();
    test_plan_gap_on_empty_object();
    test_plan_append_after_short_segment();

    std::cout << "\n=== Store helpers ===" << std::endl;
    test_manifest_ref_round_trip();
    test_swift_info_url_strips_two_components();
    test_factory_rejects_unknown_type();
    test_local_store_range_past_end_is_416();

    std::cout << "\n=== Configuration ===" << std::endl;
    test_apply_map_and_validate();
    test_chunk_size_floor();
    test_required_parameters();
    test_bad_parameters_rejected();
    test_cli_args();
    test_cli_unknown_option();
    test_json_config();

    std::cout << "\n=== Driver writes ===" << std::endl;
    test_fresh_write_creates_manifest_and_segments();
    test_overwrite_inside_segment();
    test_write_past_end_of_empty_object();
    test_resumability();
    test_gap_padding();
    test_tail_preservation();
    test_boundary_offsets();
    test_append_after_short_segment();
    test_empty_write_inside_data_changes_nothing();
    test_empty_write_past_end_extends_with_zeros();
    test_adopt_plain_object();
    test_adopt_directory_marker();
    test_put_content_replaces_manifest();
    test_stale_segments_purged_on_create();

    std::cout << "\n=== Driver reads and metadata ===" << std::endl;
    test_prefix_applied_to_store_names();
    test_read_stream_from_offset();
    test_read_stream_at_or_after_end_is_empty();
    test_missing_paths_are_not_found();
    test_invalid_paths_rejected();
    test_url_for_unsupported();
    test_directories_and_listing();
    test_move_segmented_object();

    std::cout << "\n=== Driver delete ===" << std::endl;
    test_per_object_delete();
    test_bulk_delete_covers_segments();
    test_bulk_failure_falls_back();
    test_partial_bulk_failure_sweeps_segments();

    std::cout << "\n=== Driver failure handling ===" << std::endl;
    test_resume_after_failed_segment_put();
    test_failed_padding_reports_zero_bytes();
    test_failed_trailing_zero_segment_is_reported();
    test_constructor_rejects_missing_container();

    std::cout << "\n=== Metrics ===" << std::endl;
    test_operations_counted();
    test_write_prom_file();

    std::cout << "\n==================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
