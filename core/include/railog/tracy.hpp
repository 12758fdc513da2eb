#pragma once

#ifdef RAILOG_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define RAILOG_ZONE ZoneScoped
#else
#  define RAILOG_ZONE
#endif
