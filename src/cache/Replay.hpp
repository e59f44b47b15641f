#pragma once

#include <iostream>

#include "Cache.hpp"

/**
 * Prints the recorded calls of `op`:
 *
 *   Cache.store was called 2 times:
 *   Cache.store(*('foo',)) -> 5b0c...
 *   Cache.store(*(123,)) -> 9e1f...
 *
 * Inputs and outputs are paired by position; extra entries on the
 * longer list are not printed.
 * Does nothing when `op` is not bound to a Cache or the Cache's store
 * handle is not connected.
 */
void replay(const BoundOperation& op, std::ostream& out = std::cout);
