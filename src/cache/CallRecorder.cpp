#include "CallRecorder.hpp"

#include "Conversions.hpp"

HistoryKeys HistoryKeys::forOperation(const std::string& operation) {
    return HistoryKeys{operation, operation + ":inputs", operation + ":outputs"};
}

CallRecorder::CallRecorder(StoreHandle& s, std::string operation)
    : store(s),
      name(std::move(operation)),
      historyKeys(HistoryKeys::forOperation(name)) {}

long long CallRecorder::countCall() {
    return store.incr(historyKeys.counter);
}

void CallRecorder::recordInput(const std::string& args) {
    store.rpush(historyKeys.inputs, args);
}

void CallRecorder::recordOutput(const std::string& result) {
    store.rpush(historyKeys.outputs, result);
}

CallHistory readHistory(StoreHandle& store, const std::string& operation) {
    HistoryKeys keys = HistoryKeys::forOperation(operation);
    CallHistory history;

    if (store.exists(keys.counter)) {
        auto raw = store.get(keys.counter);
        if (raw)
            history.calls = parseInteger(*raw);
    }

    history.inputs = store.lrange(keys.inputs, 0, -1);
    history.outputs = store.lrange(keys.outputs, 0, -1);
    return history;
}
