#include "receiver.hpp"
#include "receiver_impl.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "ble/address.hpp"

using namespace ble;

namespace {
constexpr char const* bluez_service        = "org.bluez";
constexpr char const* device_interface     = "org.bluez.Device1";
constexpr char const* adapter_interface    = "org.bluez.Adapter1";
constexpr char const* properties_interface = "org.freedesktop.DBus.Properties";
constexpr char const* objmanager_interface = "org.freedesktop.DBus.ObjectManager";

using managed_objects =
    std::map<sdbus::ObjectPath, std::map<std::string, property_map>>;

/**
 * Copies the Device1 properties present in changed into p.
 * Returns true if ManufacturerData was among them.
 */
bool update_packet(BlePacket& p, property_map const& changed, uint16_t preferred) {
    auto end = changed.end();
    if (auto it = changed.find("Address"); it != end) {
        auto mac = canonical_address(it->second.get<std::string>());
        if (mac) p.mac = *mac;
    }
    if (auto it = changed.find("Name"); it != end) p.device_name = it->second.get<std::string>();
    if (auto it = changed.find("RSSI"); it != end) p.signal_strength = it->second.get<int16_t>();

    auto md = changed.find("ManufacturerData");
    if (md == end) return false;

    manufacturer_data_map data;
    for (auto const& [id, v] : md->second.get<std::map<uint16_t, sdbus::Variant>>())
        data.emplace(id, v.get<std::vector<uint8_t>>());
    if (data.size() > 1) {
        spdlog::trace("{} advertises {} manufacturer ids", p.mac, data.size());
    }
    return select_manufacturer_data(p, data, preferred);
}

bool under_adapter(sdbus::ObjectPath const& obj, std::string const& adapter_path) {
    return obj.compare(0, adapter_path.size() + 1, adapter_path + "/") == 0;
}
}  // namespace

BleListener::BleListener(std::function<listener_callback> cb, uint16_t preferred_manufacturer,
                         std::string const& adapter)
    : impl(std::make_unique<Impl>(std::move(cb), preferred_manufacturer, adapter)) {}

BleListener::~BleListener() = default;

void BleListener::start() { impl->start(); }
void BleListener::stop() noexcept { impl->stop(); }

void BleListener::blacklist(std::string const& mac) { impl->blacklist(mac); }

std::vector<std::string> BleListener::get_blacklist() const { return impl->get_blacklist(); }

BleListener::Impl::Impl(std::function<listener_callback> cb, uint16_t preferred_manufacturer,
                        std::string const& adapter)
    : callback_(std::move(cb)),
      preferred_manufacturer(preferred_manufacturer),
      adapter_name(adapter),
      adapter_path("/org/bluez/" + adapter) {
    if (!callback_) throw std::logic_error("BleListener initialized with empty callback");
    create_connection();
}

BleListener::Impl::~Impl() { stop(); }

void BleListener::Impl::create_connection() {
    connection = sdbus::createSystemBusConnection();
    adapter    = sdbus::createProxy(*connection, bluez_service, adapter_path);
    objmanager = sdbus::createProxy(*connection, bluez_service, "/");

    objmanager->uponSignal("InterfacesAdded")
        .onInterface(objmanager_interface)
        .call([this](sdbus::ObjectPath const& obj,
                     std::map<std::string, property_map> const& interfaces) {
            device_added(obj, interfaces);
        });

    objmanager->uponSignal("InterfacesRemoved")
        .onInterface(objmanager_interface)
        .call([this](sdbus::ObjectPath const& obj, std::vector<std::string> const& interfaces) {
            device_removed(obj, interfaces);
        });

    adapter->uponSignal("PropertiesChanged")
        .onInterface(properties_interface)
        .call([this](std::string const& interface, property_map const& changed,
                     std::vector<std::string> const& /*invalid*/) {
            adapter_changed(interface, changed);
        });

    adapter->finishRegistration();
    objmanager->finishRegistration();
}

void BleListener::Impl::start() {
    spdlog::debug("Listening on adapter {}", adapter_name);

    // Devices BlueZ already knows about never show up in InterfacesAdded
    managed_objects known;
    objmanager->callMethod("GetManagedObjects")
        .onInterface(objmanager_interface)
        .storeResultsTo(known);
    for (auto const& [obj, interfaces] : known) {
        auto dev = interfaces.find(device_interface);
        if (dev != interfaces.end()) add_device(obj, dev->second, false);
    }

    start_discovery();
    connection->enterEventLoop();
    if (exited_with_error) throw std::runtime_error("BleListener exited with error");
}

void BleListener::Impl::blacklist(std::string const& mac) {
    auto canonical = canonical_address(mac).value_or(mac);
    {
        std::lock_guard g(blist_mtx);
        if (!blist.insert(canonical).second) return;
    }
    spdlog::debug("Blacklisting {}", canonical);

    std::lock_guard g(devices_mtx);
    for (auto it = devices.begin(); it != devices.end(); ++it) {
        if (it->second.last.mac == canonical) {
            retired.push_back(std::move(it->second.proxy));
            devices.erase(it);
            break;
        }
    }
}

std::vector<std::string> BleListener::Impl::get_blacklist() const {
    std::lock_guard g(blist_mtx);
    return { blist.begin(), blist.end() };
}

bool BleListener::Impl::is_blacklisted(std::string const& mac) const {
    std::lock_guard g(blist_mtx);
    return blist.count(mac) != 0;
}

void BleListener::Impl::device_added(sdbus::ObjectPath const& obj,
                                     std::map<std::string, property_map> const& interfaces) {
    auto dev = interfaces.find(device_interface);
    if (dev != interfaces.end()) add_device(obj, dev->second, true);
}

void BleListener::Impl::add_device(sdbus::ObjectPath const& obj, property_map const& properties,
                                   bool announce) {
    if (!under_adapter(obj, adapter_path)) return;

    BlePacket packet;
    bool has_data = false;
    try {
        has_data = update_packet(packet, properties, preferred_manufacturer);
    } catch (sdbus::Error const& e) {
        spdlog::debug("Unexpected properties on {}: {} - {}", std::string(obj), e.getName(),
                      e.getMessage());
        return;
    }
    if (packet.mac.empty() || is_blacklisted(packet.mac)) return;

    try {
        std::lock_guard g(devices_mtx);
        retired.clear();
        if (devices.count(obj) != 0) return;

        auto proxy = sdbus::createProxy(*connection, bluez_service, obj);
        proxy->uponSignal("PropertiesChanged")
            .onInterface(properties_interface)
            .call([this, obj](std::string const& interface, property_map const& changed,
                              std::vector<std::string> const& /*invalid*/) {
                if (interface == device_interface) device_changed(obj, changed);
            });
        proxy->finishRegistration();

        devices.emplace(obj, tracked_device{ std::move(proxy), packet });
        spdlog::trace("Added {} ({})", packet.mac, std::string(obj));
    } catch (sdbus::Error const& e) {
        spdlog::warn("Failed to add device: {} - {}", e.getName(), e.getMessage());
        return;
    }

    if (announce && has_data) {
        packet.received_at = std::chrono::system_clock::now();
        callback_(packet);
    }
}

void BleListener::Impl::device_removed(sdbus::ObjectPath const& obj,
                                       std::vector<std::string> const& interfaces) {
    if (std::find(interfaces.begin(), interfaces.end(), device_interface) == interfaces.end())
        return;

    std::lock_guard g(devices_mtx);
    retired.clear();
    auto it = devices.find(obj);
    if (it == devices.end()) return;
    spdlog::trace("Removed {}", it->second.last.mac);
    devices.erase(it);
}

void BleListener::Impl::device_changed(sdbus::ObjectPath const& obj, property_map const& changed) {
    BlePacket packet;
    {
        std::lock_guard g(devices_mtx);
        auto it = devices.find(obj);
        if (it == devices.end()) return;  // Blacklisted in the meantime
        try {
            if (!update_packet(it->second.last, changed, preferred_manufacturer)) return;
        } catch (sdbus::Error const& e) {
            spdlog::debug("Unexpected properties on {}: {} - {}", it->second.last.mac,
                          e.getName(), e.getMessage());
            return;
        }
        packet = it->second.last;
    }
    packet.received_at = std::chrono::system_clock::now();
    callback_(packet);
}

void BleListener::Impl::adapter_changed(std::string const& interface, property_map const& changed) {
    if (interface != adapter_interface || !should_discover) return;

    auto p = changed.find("Discovering");
    if (p == changed.end() || p->second.get<bool>()) return;

    spdlog::info("Discovery stopped, restarting");
    if (!restart_discovery()) {
        should_discover   = false;
        exited_with_error = true;
        stop();
    }
}

bool BleListener::Impl::restart_discovery(int times, std::chrono::seconds wait) {
    for (int i = 0; i < times; ++i) {
        std::this_thread::sleep_for(wait);
        try {
            start_discovery();
            return true;
        } catch (sdbus::Error const& e) {
            spdlog::warn("Failed to restart discovery, {} attempts remaining: {} - {}",
                         times - i - 1, e.getName(), e.getMessage());
        }
    }
    return false;
}

void BleListener::Impl::start_discovery() {
    spdlog::info("Starting bluetooth discovery on {}", adapter_name);

    // Every advertisement, not only the first one per device
    property_map filter;
    filter["DuplicateData"] = sdbus::Variant(true);
    filter["Transport"]     = sdbus::Variant(std::string("le"));
    adapter->callMethod("SetDiscoveryFilter")
        .onInterface(adapter_interface)
        .withArguments(filter)
        .storeResultsTo();

    should_discover = true;
    adapter->callMethod("StartDiscovery").onInterface(adapter_interface).storeResultsTo();
}

void BleListener::Impl::stop_discovery() {
    if (!should_discover) return;
    spdlog::info("Stopping bluetooth discovery");
    should_discover = false;
    adapter->callMethod("StopDiscovery").onInterface(adapter_interface).storeResultsTo();
}

void BleListener::Impl::stop() noexcept {
    try {
        stop_discovery();
    } catch (sdbus::Error const& e) {
        spdlog::warn("Failed to stop discovery: {} - {}", e.getName(), e.getMessage());
    }
    connection->leaveEventLoop();
}
