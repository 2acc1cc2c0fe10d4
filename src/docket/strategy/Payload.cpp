#include <docket/strategy/Payload.hpp>

namespace DK {

auto operationKind(Operation const& operation) -> OperationKind {
    return static_cast<OperationKind>(operation.index());
}

auto operationKindToString(OperationKind kind) -> std::string_view {
    switch (kind) {
    case OperationKind::ListStates:
        return "list_states";
    case OperationKind::ListCommissions:
        return "list_commissions";
    case OperationKind::SearchCases:
        return "search_cases";
    }
    return "unknown";
}

} // namespace DK
