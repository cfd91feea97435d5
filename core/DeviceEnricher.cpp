#include "DeviceEnricher.hpp"
#include <iostream>

namespace lan_watch::core
{
    DeviceEnricher::DeviceEnricher(const ArpResolver &arp, DeviceRegistry &registry, VendorResolver *vendor)
        : m_arp(arp), m_registry(registry), m_vendor(vendor)
    {
    }

    void DeviceEnricher::ResolveHardware(std::vector<common::Device> &devices) const
    {
        m_arp.Resolve(devices);
    }

    void DeviceEnricher::Enrich(std::vector<common::Device> &devices, const CancelCheck &cancelled)
    {
        ResolveHardware(devices);
        EnrichResolved(devices, cancelled);
    }

    std::optional<std::string> DeviceEnricher::LookupVendorName(const common::Device &device)
    {
        if (!m_vendor || !device.hardware_address)
            return std::nullopt;

        try
        {
            auto name = m_vendor->Resolve(*device.hardware_address);
            if (!name)
                std::cerr << "[Vendor] No manufacturer for " << *device.hardware_address << ", keeping default name\n";
            return name;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Vendor] Lookup for " << *device.hardware_address << " failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    void DeviceEnricher::EnrichResolved(std::vector<common::Device> &devices, const CancelCheck &cancelled)
    {
        for (auto &device : devices)
        {
            if (!m_registry.EnsureRegistered(device))
                continue;

            m_registry.AssignId(device);
            m_registry.HydrateName(device);
        }

        for (auto &device : devices)
        {
            if (device.display_name || !device.hardware_address || !device.id)
                continue;
            if (cancelled && cancelled())
                break;

            auto name = LookupVendorName(device);
            if (!name)
                continue;

            if (m_registry.SetName(*device.hardware_address, *name))
                device.display_name = *name;
        }
    }
}
