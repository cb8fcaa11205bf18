// tests/listeners/test_process_listener.cpp
#define BOOST_TEST_MODULE ProcessListenerTest

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "scout/listeners/errors.hpp"
#include "scout/listeners/process_listener.hpp"

using namespace scout::listeners;
namespace fs = std::filesystem;

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(20);
constexpr auto EVENT_TIMEOUT = std::chrono::milliseconds(2000);
constexpr auto QUIET_PERIOD = std::chrono::milliseconds(150);

// Lays out <root>/<pid>/{comm,stat} the way procfs does
struct ProcFixture {
    ProcFixture() {
        root = fs::temp_directory_path() /
               ("scout_proc_" +
                std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root / "self");
    }

    ~ProcFixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void add_process(int pid, const std::string& comm, uint64_t start_time) {
        auto dir = root / std::to_string(pid);
        fs::create_directories(dir);
        write(dir / "comm", comm + "\n");
        write(dir / "stat",
              std::to_string(pid) + " (" + comm + ") S 1 " +
                  std::to_string(pid) + " " + std::to_string(pid) +
                  " 0 -1 4194560 0 0 0 0 0 0 0 0 20 0 1 0 " +
                  std::to_string(start_time) + " 1000 100\n");
    }

    // The listener polls concurrently, files appear in one step
    static void write(const fs::path& path, const std::string& content) {
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp);
            out << content;
        }
        fs::rename(tmp, path);
    }

    void remove_process(int pid) { fs::remove_all(root / std::to_string(pid)); }

    fs::path root;
    std::shared_ptr<ServiceChannel> added = std::make_shared<ServiceChannel>();
    std::shared_ptr<ServiceChannel> removed =
        std::make_shared<ServiceChannel>();
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(ProcessListenerTestSuite, ProcFixture)

BOOST_AUTO_TEST_CASE(test_read_process_start_time) {
    add_process(100, "nginx", 5000);
    auto info = read_process(root, 100);
    BOOST_REQUIRE(info.has_value());
    BOOST_CHECK_EQUAL(info->pid, 100);
    BOOST_CHECK_EQUAL(info->comm, "nginx");
    BOOST_CHECK_EQUAL(info->start_time, 5000u);
}

BOOST_AUTO_TEST_CASE(test_read_process_with_parentheses_in_name) {
    add_process(101, "my (odd) proc", 777);
    auto info = read_process(root, 101);
    BOOST_REQUIRE(info.has_value());
    BOOST_CHECK_EQUAL(info->comm, "my (odd) proc");
    BOOST_CHECK_EQUAL(info->start_time, 777u);
}

BOOST_AUTO_TEST_CASE(test_read_process_rejects_bad_entries) {
    BOOST_CHECK(!read_process(root, 4242).has_value());

    auto dir = root / "102";
    fs::create_directories(dir);
    write(dir / "comm", "short\n");
    write(dir / "stat", "102 (short) S 1 2 3\n");
    BOOST_CHECK(!read_process(root, 102).has_value());
}

BOOST_AUTO_TEST_CASE(test_service_attributes) {
    ProcessService service(ProcessInfo{100, "nginx", 5000},
                           std::string("node-1"));
    BOOST_CHECK_EQUAL(service.get_id(), "process://100:5000");
    BOOST_CHECK_EQUAL(service.get_pid(), 100);
    BOOST_CHECK_EQUAL(service.get_ad_identifiers().front(), "nginx");
    BOOST_CHECK_EQUAL(service.get_tags().front(), "process:nginx");
    BOOST_CHECK_EQUAL(service.get_hostname(), "node-1");
    BOOST_CHECK_THROW(service.get_hosts(), NotSupportedError);
    BOOST_CHECK_THROW(service.get_ports(), NotSupportedError);

    ProcessService anonymous(ProcessInfo{100, "nginx", 5000}, std::nullopt);
    BOOST_CHECK_THROW(anonymous.get_hostname(), NotSupportedError);
}

BOOST_AUTO_TEST_CASE(test_constructor_checks_arguments) {
    BOOST_CHECK_THROW(
        ProcessListener(root / "missing", POLL_INTERVAL, {"nginx"}),
        ListenerError);
    BOOST_CHECK_THROW(ProcessListener(root, POLL_INTERVAL, {}), ListenerError);
}

BOOST_AUTO_TEST_CASE(test_scan_filters_by_command) {
    add_process(100, "nginx", 5000);
    add_process(200, "bash", 6000);
    add_process(300, "redis-server", 7000);

    ProcessListener listener(root, POLL_INTERVAL, {"nginx", "redis-server"});
    auto found = listener.scan();
    BOOST_CHECK_EQUAL(found.size(), 2u);
    for (const auto& info : found) {
        BOOST_CHECK(info.comm != "bash");
    }
}

BOOST_AUTO_TEST_CASE(test_reports_process_lifetime) {
    add_process(100, "nginx", 5000);
    add_process(200, "bash", 6000);

    ProcessListener listener(root, POLL_INTERVAL, {"nginx"});
    listener.listen(added, removed);

    auto service = added->receive_for(EVENT_TIMEOUT);
    BOOST_REQUIRE(service.has_value());
    BOOST_CHECK_EQUAL((*service)->get_id(), "process://100:5000");
    BOOST_CHECK(!added->receive_for(QUIET_PERIOD).has_value());

    remove_process(100);
    auto gone = removed->receive_for(EVENT_TIMEOUT);
    BOOST_REQUIRE(gone.has_value());
    BOOST_CHECK_EQUAL((*gone)->get_id(), "process://100:5000");

    listener.stop();
}

BOOST_AUTO_TEST_CASE(test_recycled_pid_gets_new_id) {
    add_process(100, "nginx", 5000);
    ProcessListener listener(root, POLL_INTERVAL, {"nginx"});
    listener.listen(added, removed);
    BOOST_REQUIRE(added->receive_for(EVENT_TIMEOUT).has_value());

    // Same pid, later start time
    add_process(100, "nginx", 9000);

    auto replacement = added->receive_for(EVENT_TIMEOUT);
    BOOST_REQUIRE(replacement.has_value());
    BOOST_CHECK_EQUAL((*replacement)->get_id(), "process://100:9000");
    auto old = removed->receive_for(EVENT_TIMEOUT);
    BOOST_REQUIRE(old.has_value());
    BOOST_CHECK_EQUAL((*old)->get_id(), "process://100:5000");

    listener.stop();
}

BOOST_AUTO_TEST_SUITE_END()
