#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// MCU Transfer - ETL profile.
// Containers report contract violations through etl::error_handler instead of
// throwing; the transfer engine routes them to the library log.
// Compiler and language level are left to ETL's own detection.

#define ETL_NO_EXCEPTIONS
#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP
#define ETL_CALLBACK_ON_ERROR

#endif
