#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(dwCore, "docweave.core")
Q_LOGGING_CATEGORY(dwAnalysis, "docweave.analysis")
Q_LOGGING_CATEGORY(dwIndex, "docweave.index")
Q_LOGGING_CATEGORY(dwSearch, "docweave.search")
Q_LOGGING_CATEGORY(dwGeneration, "docweave.generation")
