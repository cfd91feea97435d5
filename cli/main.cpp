#include "Options.hpp"
#include "RenamePrompt.hpp"
#include "../common/CommandRunner.hpp"
#include "../core/ChangeDetector.hpp"
#include "../core/LocalIdentity.hpp"
#include "../core/Notifier.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace
{
    std::atomic<bool> g_stop(false);

    void HandleSignal(int)
    {
        g_stop = true;
    }

    int Run(const lan_watch::core::MonitorConfig &config)
    {
        using namespace lan_watch;

        common::ShellCommandRunner runner;

        core::LocalIdentityResolver identity_resolver(runner);
        common::LocalIdentity self = identity_resolver.Resolve();
        std::cout << "[Main] Your local IP is " << self.network_address << " and your MAC is "
                  << self.hardware_address.value_or(common::UNKNOWN_NAME) << ".\n";

        std::unique_ptr<core::Prober> prober;
        if (config.probe_method == core::ProbeMethod::Icmp)
            prober = std::make_unique<core::IcmpProber>();
        else
            prober = std::make_unique<core::PingCommandProber>(runner);

        core::ProbePool pool(*prober, config.parallelism);
        core::Sweeper sweeper(pool);
        core::ArpResolver arp(config.arp_table);

        core::DeviceRegistry registry;
        if (!registry.Initialize(config.db_path))
            throw common::ConfigurationError("Cannot open device registry " + config.db_path);

        std::unique_ptr<core::MacVendorsClient> vendor_client;
        std::unique_ptr<core::RateLimitedVendorResolver> vendor;
        if (config.vendor_enabled)
        {
            vendor_client = std::make_unique<core::MacVendorsClient>(config.vendor_host);
            vendor = std::make_unique<core::RateLimitedVendorResolver>(*vendor_client, config.vendor_spacing);
        }

        core::DeviceEnricher enricher(arp, registry, vendor.get());
        core::Notifier notifier(std::cout, runner, config.alert_command);
        if (!config.watched_ids.empty())
            notifier.AddAlertFilter(std::make_shared<core::WatchListFilter>(config.watched_ids));

        // Declared after everything its monitor thread touches so it is joined first.
        core::ChangeDetector detector(config, sweeper, enricher, registry, self.network_address, &g_stop);

        if (g_stop)
            return cli::EXIT_OK;
        std::vector<common::Device> baseline = detector.Discover();
        if (g_stop)
            return cli::EXIT_OK;
        notifier.PrintDeviceList(baseline);
        if (config.list_only)
            return cli::EXIT_OK;

        detector.Start([&notifier](const core::DeviceEvent &event)
                       { notifier.Dispatch(event); },
                       [&notifier](const std::vector<common::Device> &live)
                       { notifier.PrintDeviceList(live); });

        std::unique_ptr<cli::RenamePrompt> prompt;
        if (config.interactive_rename)
        {
            prompt = std::make_unique<cli::RenamePrompt>(detector, STDIN_FILENO);
            prompt->Start();
        }

        std::cout << "Monitoring LAN for changes... (hit CTRL + C to quit)" << std::endl;
        while (!g_stop)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (prompt)
            prompt->Stop();
        detector.Stop();
        return cli::EXIT_OK;
    }
}

int main(int argc, char *argv[])
{
    using namespace lan_watch;

    cli::Options options;
    try
    {
        options = cli::ParseOptions(argc, argv);
    }
    catch (const cli::UsageError &e)
    {
        std::cerr << e.what() << std::endl;
        cli::PrintHelp(std::cerr, argv[0]);
        return cli::EXIT_USAGE;
    }

    if (options.show_help)
    {
        cli::PrintHelp(std::cout, argv[0]);
        return cli::EXIT_OK;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try
    {
        return Run(options.config);
    }
    catch (const common::ConfigurationError &e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return cli::EXIT_CONFIGURATION;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return cli::EXIT_RUNTIME;
    }
}
