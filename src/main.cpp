#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "controller_config.h"
#include "netem_cli.h"
#include "profile_controller.h"
#include "lib/command_runner.h"
#include "lib/tc_backend.h"

// Define flags
DEFINE_string(config, "", "Optional YAML file with interface names and profile overrides.");
DEFINE_string(dev, "", "Interface to shape. Overrides the config file and NETEM_DEV.");
DEFINE_string(ifb, "", "IFB interface carrying ingress traffic. Overrides the config file and NETEM_IFB.");
DEFINE_bool(dry_run, false, "Log the ip/tc commands instead of running them.");
DEFINE_bool(strict, false, "Exit with status 2 when a traffic control command fails.");


int main(int argc, char* argv[]) {
    std::string program = argv[0];
    gflags::SetUsageMessage(usageText(program));
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);

    FLAGS_logtostderr = true;

    std::vector<std::string> args(argv + 1, argv + argc);
    auto profile = selectProfile(program, args, std::cerr);
    if (!profile) {
        return kExitUsage;
    }

    ControllerConfig config;
    try {
        if (!FLAGS_config.empty()) {
            LOG(INFO) << "loading config from " << FLAGS_config;
            config.parseConfig(FLAGS_config);
        }
        config.applyEnvironment();
        config.applyOverrides(FLAGS_dev, FLAGS_ifb);
        config.validate();
    } catch (const ConfigParseException& e) {
        LOG(ERROR) << e.what();
        return kExitConfig;
    }

    std::unique_ptr<CommandRunner> runner;
    if (FLAGS_dry_run) {
        runner = std::make_unique<DryRunCommandRunner>();
    } else {
        runner = std::make_unique<ShellCommandRunner>();
    }

    TcBackend backend(*runner);
    ProfileController controller(config, backend);
    int status = runProfile(controller, *profile, FLAGS_strict, std::cout);

    google::ShutdownGoogleLogging();
    return status;
}
