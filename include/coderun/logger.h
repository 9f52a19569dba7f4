#ifndef INCLUDE_CODERUN_LOGGER_H_
#define INCLUDE_CODERUN_LOGGER_H_

// Keep the console sink usable in forked children; call once before any fork
void InitLogger();

#endif  // INCLUDE_CODERUN_LOGGER_H_
