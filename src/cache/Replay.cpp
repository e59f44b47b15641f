#include "Replay.hpp"

#include <algorithm>

#include "../utils/repr.hpp"

void replay(const BoundOperation& op, std::ostream& out) {
    if (op.owner == nullptr || op.name.empty())
        return;

    StoreHandle& store = op.owner->handle();
    if (!store.connected())
        return;

    CallHistory history = readHistory(store, op.name);

    out << op.name << " was called " << history.calls << " times:\n";

    size_t pairs = std::min(history.inputs.size(), history.outputs.size());
    for (size_t i = 0; i < pairs; i++) {
        out << op.name << "(*" << history.inputs[i] << ") -> "
            << quoteText(history.outputs[i], true) << "\n";
    }
}
