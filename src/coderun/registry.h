#ifndef CODERUN_REGISTRY_H_
#define CODERUN_REGISTRY_H_

#include <coderun/execution.h>
#include "pipeline.h"

// built on first use; never modified afterwards
const Pipeline& GetPipeline(Language);

#endif  // CODERUN_REGISTRY_H_
