#include <csignal>
#include <cstdlib>

#include <docket/config/DocketOptions.hpp>
#include <docket/core/DocketEngine.hpp>
#include <docket/service/ApiServer.hpp>

namespace {
void handle_signal(int) {
    DK::Service::RequestDocketServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = DK::ParseDocketArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        DK::PrintDocketUsage("docket_server");
        return EXIT_SUCCESS;
    }

    DK::DocketEngine engine{options};
    DK::Service::ResetDocketServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return DK::Service::RunDocketServer(engine, options);
}
