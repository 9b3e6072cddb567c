#include "ProjectSearchDebug.hpp"

Q_LOGGING_CATEGORY(PROJECTSEARCH_LOG, "projectsearch", QtInfoMsg)
