#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// SceneLink host profile.
// The STL and exceptions are available on the host, but ETL containers are
// still used for the bounded queues and fixed tables. Errors are logged
// through etl::error_handler (see util/log.cpp), never thrown.

#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP

#endif
