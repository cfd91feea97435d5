#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "../common/Device.hpp"

namespace lan_watch::core
{
    struct RegistryRecord
    {
        int id;
        std::string hardware_address;
        std::string name;
    };

    /*
     * Persistent device table keyed by hardware address.
     *
     * Rows are only ever inserted or renamed, never deleted. Every public call
     * takes the registry mutex, so writes for a given hardware address are
     * serialized even if callers run on several threads.
     */
    class DeviceRegistry
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        std::optional<RegistryRecord> LookupLocked(const std::string &hardware_address);

    public:
        DeviceRegistry();
        ~DeviceRegistry();

        DeviceRegistry(const DeviceRegistry &) = delete;
        DeviceRegistry &operator=(const DeviceRegistry &) = delete;

        // Opens (or creates) the store and its table. ":memory:" is accepted.
        bool Initialize(const std::string &db_path);
        void Shutdown();

        // Inserts a row with the default name unless one exists for this hardware address.
        bool EnsureRegistered(const common::Device &device);

        // Copies the stored name into an unnamed device. Stored sentinel names are not copied.
        void HydrateName(common::Device &device);

        // Assign-once: does nothing if the device already carries an id.
        void AssignId(common::Device &device);

        bool SetName(const std::string &hardware_address, const std::string &name);

        std::optional<RegistryRecord> Lookup(const std::string &hardware_address);
        std::optional<RegistryRecord> FindById(int id);
        std::vector<RegistryRecord> AllRecords();
    };
}
