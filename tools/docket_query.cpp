#include <docket/config/DocketOptions.hpp>
#include <docket/core/DocketEngine.hpp>
#include <docket/service/HttpHelpers.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "Usage: docket_query [options] <command>\n"
                 "Commands:\n"
                 "  states                                         List every state\n"
                 "  commissions <state>                            List the commissions of a state (name or id)\n"
                 "  search <type> <state> <commission> <value> [case type]\n"
                 "                                                 Search cases; type is one of case_number,\n"
                 "                                                 complainant, respondent, complainant_advocate,\n"
                 "                                                 respondent_advocate, industry_type, judge\n"
                 "\n";
    DK::PrintDocketUsage("docket_query");
}

int fail(DK::Error const& error) {
    std::cerr << "docket_query: " << DK::describeError(error) << '\n';
    std::cerr << DK::Service::error_to_json(error).dump(2) << '\n';
    return EXIT_FAILURE;
}

template <typename T>
int emit(DK::Expected<T> const& result) {
    if (!result) {
        return fail(result.error());
    }
    std::cout << nlohmann::json(*result).dump(2) << '\n';
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    auto                     options_opt = DK::ParseDocketArguments(argc, argv, &args);
    if (!options_opt) {
        return EXIT_FAILURE;
    }
    if (options_opt->show_help || args.empty()) {
        print_usage();
        return options_opt->show_help ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    DK::DocketEngine engine{*options_opt};
    auto const&      command = args.front();

    if (command == "states" && args.size() == 1) {
        return emit(engine.listStates());
    }

    if (command == "commissions" && args.size() == 2) {
        auto state = engine.resolveState(args[1]);
        if (!state) {
            return fail(state.error());
        }
        return emit(engine.listCommissions(state->id));
    }

    if (command == "search" && (args.size() == 5 || args.size() == 6)) {
        auto type = DK::parseSearchType(args[1]);
        if (!type) {
            std::cerr << "docket_query: unknown search type '" << args[1] << "'\n";
            return EXIT_FAILURE;
        }
        DK::CaseSearchRequest request{};
        request.search_type  = *type;
        request.state        = args[2];
        request.commission   = args[3];
        request.search_value = args[4];
        if (args.size() == 6) {
            auto case_type = DK::parseCaseType(args[5]);
            if (!case_type) {
                std::cerr << "docket_query: unknown case type '" << args[5] << "'\n";
                return EXIT_FAILURE;
            }
            request.case_type = *case_type;
        }
        return emit(engine.searchCasesByName(request));
    }

    std::cerr << "docket_query: unrecognized command\n";
    print_usage();
    return EXIT_FAILURE;
}
