#include "scout/listeners/service_snapshot.hpp"

#include "scout/listeners/errors.hpp"
#include "scout/log/logger.hpp"

namespace scout::listeners {

namespace {

template <typename T, typename Getter>
void query(ServiceSnapshot& snapshot, const char* attribute,
           std::optional<T>& field, Getter getter) {
    try {
        field = getter();
    } catch (const NotSupportedError&) {
        field.reset();
    } catch (const std::exception& e) {
        SCOUT_LOG_DEBUG << "Service " << snapshot.id << ": " << attribute
                        << " unavailable: " << e.what();
        field.reset();
        snapshot.errors[attribute] = e.what();
    }
}

}  // namespace

ServiceSnapshot capture(const Service& service) {
    ServiceSnapshot snapshot;
    snapshot.id = service.get_id();

    query(snapshot, "ad_identifiers", snapshot.ad_identifiers,
          [&] { return service.get_ad_identifiers(); });
    query(snapshot, "hosts", snapshot.hosts,
          [&] { return service.get_hosts(); });
    query(snapshot, "ports", snapshot.ports,
          [&] { return service.get_ports(); });
    query(snapshot, "tags", snapshot.tags, [&] { return service.get_tags(); });
    query(snapshot, "pid", snapshot.pid, [&] { return service.get_pid(); });
    query(snapshot, "hostname", snapshot.hostname,
          [&] { return service.get_hostname(); });

    return snapshot;
}

void to_json(nlohmann::json& j, const ContainerPort& p) {
    j = nlohmann::json{{"port", p.port}, {"name", p.name}};
}

void from_json(const nlohmann::json& j, ContainerPort& p) {
    j.at("port").get_to(p.port);
    p.name = j.value("name", std::string());
}

void to_json(nlohmann::json& j, const ServiceSnapshot& s) {
    j = nlohmann::json{{"id", s.id}};
    if (s.ad_identifiers) j["ad_identifiers"] = *s.ad_identifiers;
    if (s.hosts) j["hosts"] = *s.hosts;
    if (s.ports) j["ports"] = *s.ports;
    if (s.tags) j["tags"] = *s.tags;
    if (s.pid) j["pid"] = *s.pid;
    if (s.hostname) j["hostname"] = *s.hostname;
    if (!s.errors.empty()) j["errors"] = s.errors;
}

}  // namespace scout::listeners
