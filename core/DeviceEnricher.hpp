#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ArpResolver.hpp"
#include "DeviceEvent.hpp"
#include "DeviceRegistry.hpp"
#include "VendorClient.hpp"

namespace lan_watch::core
{
    /*
     * Fills in identity and name for freshly seen devices.
     *
     * Per device the order is fixed: hardware address, registration, id, stored
     * name, and only then the vendor service for devices that are still unnamed.
     * The vendor resolver may be null, in which case lookups are skipped.
     * `cancelled` is checked before every vendor call; rows already written stay.
     */
    class DeviceEnricher
    {
    public:
        DeviceEnricher(const ArpResolver &arp, DeviceRegistry &registry, VendorResolver *vendor);

        void Enrich(std::vector<common::Device> &devices, const CancelCheck &cancelled = nullptr);

        // Same as Enrich() for devices whose hardware address has already been looked up.
        void EnrichResolved(std::vector<common::Device> &devices, const CancelCheck &cancelled = nullptr);

        void ResolveHardware(std::vector<common::Device> &devices) const;

        // Stored and displayed names are left alone on failure.
        std::optional<std::string> LookupVendorName(const common::Device &device);

    private:
        const ArpResolver &m_arp;
        DeviceRegistry &m_registry;
        VendorResolver *m_vendor;
    };
}
