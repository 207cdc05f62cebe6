//
//  log.h
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef log_h
#define log_h


#ifdef __cplusplus
extern "C"{
#endif
    
#include <stdio.h>
    
#define notice(a ...) devagentd_log(LL_NOTICE,a)
#define info(a ...) devagentd_log(LL_INFO,a)
#define warning(a ...) devagentd_log(LL_WARNING,a)
#define error(a ...) devagentd_log(LL_ERROR,a)
#define fatal(a ...) devagentd_log(LL_FATAL,a)
    
#ifdef DEBUG
#   define debug(a ...) devagentd_log(LL_DEBUG,a)
#else
#   define debug(a ...)
#endif
    
    enum loglevel {
        LL_FATAL = 0,
        LL_ERROR,
        LL_WARNING,
        LL_INFO,
        LL_NOTICE,
        LL_DEBUG
    };
    
    extern unsigned int log_level;
    
    void log_enable_syslog(void);
    void log_disable_syslog(void);
    
    void devagentd_log(enum loglevel level, const char *fmt, ...) __attribute__ ((format (printf, 2, 3)));
    
    
#ifdef __cplusplus
}
#endif
#endif /* log_h */
