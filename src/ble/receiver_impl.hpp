#pragma once

#include <ble/receiver.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>

#include <sdbus-c++/sdbus-c++.h>

namespace ble {

using property_map = std::map<std::string, sdbus::Variant>;

class BleListener::Impl {
public:
    Impl(std::function<listener_callback> cb, uint16_t preferred_manufacturer,
         std::string const& adapter);
    ~Impl();

    void stop() noexcept;
    void start();

    void blacklist(std::string const& mac);
    std::vector<std::string> get_blacklist() const;

private:
    // Last known state of a device, updated from PropertiesChanged
    struct tracked_device {
        std::unique_ptr<sdbus::IProxy> proxy;
        BlePacket last;
    };

    std::function<listener_callback> callback_;
    const uint16_t preferred_manufacturer;
    std::string adapter_name;
    std::string adapter_path;

    std::unique_ptr<sdbus::IConnection> connection;
    std::unique_ptr<sdbus::IProxy> adapter;
    std::unique_ptr<sdbus::IProxy> objmanager;

    std::map<sdbus::ObjectPath, tracked_device> devices;
    // Proxies of blacklisted devices, released outside of their own signal handlers
    std::vector<std::unique_ptr<sdbus::IProxy>> retired;
    std::mutex devices_mtx;

    // Canonical addresses
    std::set<std::string> blist;
    mutable std::mutex blist_mtx;

    std::atomic_bool should_discover   = false;
    std::atomic_bool exited_with_error = false;

    void device_added(sdbus::ObjectPath const& obj,
                      std::map<std::string, property_map> const& interfaces);
    // announce == false for cached devices, their data may be old
    void add_device(sdbus::ObjectPath const& obj, property_map const& properties, bool announce);
    void device_removed(sdbus::ObjectPath const& obj, std::vector<std::string> const& interfaces);
    void adapter_changed(std::string const& interface, property_map const& changed);
    void device_changed(sdbus::ObjectPath const& obj, property_map const& changed);

    bool is_blacklisted(std::string const& mac) const;

    void create_connection();
    void start_discovery();
    void stop_discovery();
    bool restart_discovery(int times = 2, std::chrono::seconds wait = std::chrono::seconds(1));
};

}  // namespace ble
