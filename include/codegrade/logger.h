#ifndef INCLUDE_CODEGRADE_LOGGER_H_
#define INCLUDE_CODEGRADE_LOGGER_H_

// Logs go to stderr: 0 -> warn, 1 -> info, 2+ -> debug
void InitLogger(int verbosity);

#endif  // INCLUDE_CODEGRADE_LOGGER_H_
