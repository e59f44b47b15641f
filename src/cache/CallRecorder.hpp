#pragma once

#include <string>
#include <utility>
#include <vector>

#include "../client/StoreHandle.hpp"

// Store keys that hold one operation's instrumentation.
struct HistoryKeys {
    std::string counter;   // "<op>"
    std::string inputs;    // "<op>:inputs"
    std::string outputs;   // "<op>:outputs"

    static HistoryKeys forOperation(const std::string& operation);
};

// Snapshot of what the store recorded for one operation.
struct CallHistory {
    long long calls = 0;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
};

/**
 * CallRecorder
 * ------------
 * Counting and history stages wrapped around one operation:
 *
 *   countCall -> execute -> recordInput -> recordOutput
 *
 * The counter moves before execution, so failed calls are counted.
 * History is appended only after execution succeeded, which keeps the
 * two history lists the same length.
 *
 * None of this is atomic as a whole: concurrent callers may interleave
 * their history entries, while the counter stays exact.
 */
class CallRecorder {
public:
    CallRecorder(StoreHandle& store, std::string operation);

    const std::string& operation() const { return name; }
    const HistoryKeys& keys() const { return historyKeys; }

    // INCR "<op>"
    long long countCall();

    // RPUSH "<op>:inputs" args
    void recordInput(const std::string& args);

    // RPUSH "<op>:outputs" result
    void recordOutput(const std::string& result);

    /**
     * Runs `execute` with all four stages.
     * `args` is the display form of the call's arguments.
     */
    template <typename Fn>
    std::string invoke(const std::string& args, Fn&& execute) {
        countCall();
        std::string result = std::forward<Fn>(execute)();
        recordInput(args);
        recordOutput(result);
        return result;
    }

private:
    StoreHandle& store;
    std::string name;
    HistoryKeys historyKeys;
};

/**
 * Reads the counter (EXISTS then GET, 0 when absent) and both history
 * lists of `operation`.
 * Throws FormatError if the counter holds something other than an integer.
 */
CallHistory readHistory(StoreHandle& store, const std::string& operation);
