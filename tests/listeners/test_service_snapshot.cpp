// tests/listeners/test_service_snapshot.cpp
#define BOOST_TEST_MODULE ServiceSnapshotTest

#include <boost/test/unit_test.hpp>
#include <stdexcept>

#include "listeners/fake_listener.hpp"
#include "scout/listeners/errors.hpp"
#include "scout/listeners/service_snapshot.hpp"

using namespace scout::listeners;
using scout::testing::FakeService;

namespace {

// A container-like service whose hostname lookup is broken
class PartialService : public Service {
public:
    ID get_id() const override { return "docker://4f2a"; }
    std::vector<std::string> get_ad_identifiers() const override {
        return {"redis", "redis:7"};
    }
    std::map<std::string, std::string> get_hosts() const override {
        return {{"bridge", "172.17.0.2"}};
    }
    std::vector<ContainerPort> get_ports() const override {
        return {{6379, "redis"}};
    }
    std::vector<std::string> get_tags() const override {
        throw NotSupportedError();
    }
    int get_pid() const override { throw NotSupportedError("pid"); }
    std::string get_hostname() const override {
        throw std::runtime_error("inspect timed out");
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(ServiceSnapshotTestSuite)

BOOST_AUTO_TEST_CASE(test_unsupported_attributes_are_empty) {
    FakeService service("svc-1", 42);
    auto snapshot = capture(service);

    BOOST_CHECK_EQUAL(snapshot.id, "svc-1");
    BOOST_REQUIRE(snapshot.pid.has_value());
    BOOST_CHECK_EQUAL(*snapshot.pid, 42);
    BOOST_CHECK(!snapshot.ad_identifiers);
    BOOST_CHECK(!snapshot.hosts);
    BOOST_CHECK(!snapshot.ports);
    BOOST_CHECK(!snapshot.tags);
    BOOST_CHECK(!snapshot.hostname);
    BOOST_CHECK(snapshot.errors.empty());
}

BOOST_AUTO_TEST_CASE(test_failures_do_not_hide_other_attributes) {
    PartialService service;
    auto snapshot = capture(service);

    BOOST_REQUIRE(snapshot.ad_identifiers);
    BOOST_CHECK_EQUAL(snapshot.ad_identifiers->size(), 2u);
    BOOST_REQUIRE(snapshot.hosts);
    BOOST_CHECK_EQUAL(snapshot.hosts->at("bridge"), "172.17.0.2");
    BOOST_REQUIRE(snapshot.ports);
    BOOST_CHECK((snapshot.ports->front() == ContainerPort{6379, "redis"}));

    BOOST_CHECK(!snapshot.tags);
    BOOST_CHECK(!snapshot.pid);
    BOOST_CHECK(!snapshot.hostname);

    // Only the real failure is recorded
    BOOST_CHECK_EQUAL(snapshot.errors.size(), 1u);
    BOOST_CHECK_EQUAL(snapshot.errors.at("hostname"), "inspect timed out");
}

BOOST_AUTO_TEST_CASE(test_json_omits_missing_attributes) {
    nlohmann::json j = capture(FakeService("svc-1", 42));

    BOOST_CHECK_EQUAL(j.at("id").get<std::string>(), "svc-1");
    BOOST_CHECK_EQUAL(j.at("pid").get<int>(), 42);
    BOOST_CHECK(!j.contains("hosts"));
    BOOST_CHECK(!j.contains("ports"));
    BOOST_CHECK(!j.contains("errors"));
}

BOOST_AUTO_TEST_CASE(test_json_lists_errors_and_ports) {
    nlohmann::json j = capture(PartialService());

    BOOST_CHECK_EQUAL(j.at("ports").at(0).at("port").get<int>(), 6379);
    BOOST_CHECK_EQUAL(j.at("ports").at(0).at("name").get<std::string>(),
                      "redis");
    BOOST_CHECK_EQUAL(j.at("errors").at("hostname").get<std::string>(),
                      "inspect timed out");
    BOOST_CHECK(!j.contains("tags"));
}

BOOST_AUTO_TEST_CASE(test_port_from_json_without_name) {
    auto port = nlohmann::json{{"port", 8080}}.get<ContainerPort>();
    BOOST_CHECK_EQUAL(port.port, 8080);
    BOOST_CHECK(port.name.empty());
}

BOOST_AUTO_TEST_CASE(test_not_supported_detection) {
    NotSupportedError error;
    BOOST_CHECK_EQUAL(std::string(error.what()),
                      "AD: variable not supported by listener");

    BOOST_CHECK(is_not_supported(
        std::make_exception_ptr(NotSupportedError("ports"))));
    BOOST_CHECK(!is_not_supported(
        std::make_exception_ptr(std::runtime_error("timeout"))));
    BOOST_CHECK(!is_not_supported(nullptr));
}

BOOST_AUTO_TEST_SUITE_END()
