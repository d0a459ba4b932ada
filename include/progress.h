#ifndef PROGRESS_H
#define PROGRESS_H

#include <functional>
#include <string>

// `fraction` is in [0, 1] within the named session phase.
using ProgressCallback = std::function<void(const std::string& phase, double fraction)>;

#endif  // PROGRESS_H
