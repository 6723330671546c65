///
/// sForth - Configuration and Cross Platform macros
///
#ifndef __SFORTH_SRC_CONFIG_H
#define __SFORTH_SRC_CONFIG_H
#include <cstdint>
///
///@name Conditional compililation options
///@{
#define CC_DEBUG        1               /**< debug level 0|1|2      */
#define CASE_SENSITIVE  0               /**< word case sensitive    */
#define SF_SPCS_MAX     1024            /**< widest spaces request  */
#define APP_VERSION     "sForth v1.0 64-bit float"
//@}
///
///@name Logical units (instead of physical) for type check and portability
///@{
typedef uint32_t        U32;   ///< unsigned 32-bit integer
typedef int32_t         S32;   ///< signed 32-bit integer
typedef uint8_t         U8;    ///< byte, unsigned character

#include <cmath>
typedef double          DU;    ///< data unit, one stack cell
#define DU0             0.0
#define DU1             1.0
#define INT(v)          (static_cast<S32>(v))
#define MOD(m,n)        (fmod(m,n))
#define ABS(v)          (fabs(v))
#define ZEQ(v)          ((v)==DU0)
///@}
///@name String comparison
///@{
#include <cstring>
#if CASE_SENSITIVE
#define STRCMP(a, b)    (strcmp(a, b))
#else // !CASE_SENSITIVE
#include <strings.h>     // strcasecmp
#define STRCMP(a, b)    (strcasecmp(a, b))
#endif // CASE_SENSITIVE
///@}
///@name Logging supporting macros
///@{
#include <cstdio>
#define LOGS(s)         printf("%s", s)
#define LOG(v)          printf("%-ld", (int64_t)(v))
#define LOGX(v)         printf("%-lx", (uint64_t)(v))

#define LOG_KV(k, v)    LOGS(k); LOG(v)
#define LOG_KX(k, x)    LOGS(k); LOGX(x)
#define LOG_HDR(f, s)   LOGS(f); LOGS("("); LOGS(s); LOGS(") => ")
///@}
#endif // __SFORTH_SRC_CONFIG_H
