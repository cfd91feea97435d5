#include "DeviceRegistry.hpp"
#include "../common/AddressText.hpp"
#include <iostream>

namespace lan_watch::core
{
    namespace
    {
        RegistryRecord ReadRecord(sqlite3_stmt *stmt)
        {
            RegistryRecord record;
            record.id = sqlite3_column_int(stmt, 0);
            const char *mac = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
            if (mac)
                record.hardware_address = mac;
            const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 2));
            record.name = name ? name : common::UNKNOWN_NAME;
            return record;
        }

        std::string KeyFor(const std::string &hardware_address)
        {
            return common::CanonicalHardwareAddress(hardware_address).value_or(hardware_address);
        }
    }

    DeviceRegistry::DeviceRegistry() : db_(nullptr) {}

    DeviceRegistry::~DeviceRegistry()
    {
        Shutdown();
    }

    bool DeviceRegistry::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[Registry] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS clients ("
            "name TEXT DEFAULT 'unknown', "
            "mac TEXT NOT NULL, "
            "id INTEGER PRIMARY KEY, "
            "UNIQUE(mac)"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[Registry] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        return true;
    }

    void DeviceRegistry::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool DeviceRegistry::EnsureRegistered(const common::Device &device)
    {
        if (!device.hardware_address)
        {
            std::cout << "[Registry] " << device.network_address << " has no hardware address, not registered\n";
            return false;
        }

        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "INSERT OR IGNORE INTO clients (name, mac) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        std::string mac = KeyFor(*device.hardware_address);
        sqlite3_bind_text(stmt, 1, common::UNKNOWN_NAME, -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, mac.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc == SQLITE_CONSTRAINT)
        {
            std::cerr << "[Registry] Conflict while registering " << mac << ", ignored\n";
            return false;
        }
        if (rc != SQLITE_DONE)
        {
            std::cerr << "[Registry] Insert failed for " << mac << ": " << sqlite3_errmsg(db_) << "\n";
            return false;
        }
        if (sqlite3_changes(db_) > 0)
            std::cout << "[Registry] Inserting client into table: " << mac << "\n";
        return true;
    }

    std::optional<RegistryRecord> DeviceRegistry::LookupLocked(const std::string &hardware_address)
    {
        if (!db_)
            return std::nullopt;

        const char *sql = "SELECT id, mac, name FROM clients WHERE mac = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;

        std::string mac = KeyFor(hardware_address);
        sqlite3_bind_text(stmt, 1, mac.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<RegistryRecord> result = std::nullopt;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = ReadRecord(stmt);
        sqlite3_finalize(stmt);
        return result;
    }

    void DeviceRegistry::HydrateName(common::Device &device)
    {
        if (device.display_name || !device.hardware_address)
            return;

        std::lock_guard<std::mutex> lock(db_mutex_);
        auto record = LookupLocked(*device.hardware_address);
        if (!record)
        {
            std::cerr << "[Registry] No stored row for " << *device.hardware_address << " during name lookup\n";
            return;
        }

        if (record->name != common::UNKNOWN_NAME)
            device.display_name = record->name;
    }

    void DeviceRegistry::AssignId(common::Device &device)
    {
        if (device.id || !device.hardware_address)
            return;

        std::lock_guard<std::mutex> lock(db_mutex_);
        auto record = LookupLocked(*device.hardware_address);
        if (!record)
        {
            std::cerr << "[Registry] No stored row for " << *device.hardware_address << " during id lookup\n";
            return;
        }
        device.id = record->id;
    }

    bool DeviceRegistry::SetName(const std::string &hardware_address, const std::string &name)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "UPDATE clients SET name = ? WHERE mac = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        std::string mac = KeyFor(hardware_address);
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, mac.c_str(), -1, SQLITE_TRANSIENT);

        bool ok = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (ok && sqlite3_changes(db_) == 0)
        {
            std::cerr << "[Registry] Rename of unregistered " << mac << " ignored\n";
            return false;
        }
        return ok;
    }

    std::optional<RegistryRecord> DeviceRegistry::Lookup(const std::string &hardware_address)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return LookupLocked(hardware_address);
    }

    std::optional<RegistryRecord> DeviceRegistry::FindById(int id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return std::nullopt;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT id, mac, name FROM clients WHERE id = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;

        sqlite3_bind_int(stmt, 1, id);
        std::optional<RegistryRecord> result = std::nullopt;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = ReadRecord(stmt);
        sqlite3_finalize(stmt);
        return result;
    }

    std::vector<RegistryRecord> DeviceRegistry::AllRecords()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<RegistryRecord> records;
        if (!db_)
            return records;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT id, mac, name FROM clients ORDER BY id;", -1, &stmt, nullptr) != SQLITE_OK)
            return records;

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            records.push_back(ReadRecord(stmt));
        }
        sqlite3_finalize(stmt);
        return records;
    }
}
