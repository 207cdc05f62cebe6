//
//  log.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "log.h"

#include <stdarg.h>
#include <string.h>
#include <syslog.h>
#include <time.h>
#include <sys/time.h>

unsigned int log_level = LL_WARNING;

static int log_syslog = 0;

static const char *level_tag(enum loglevel level){
    switch (level) {
        case LL_FATAL:   return "FATAL";
        case LL_ERROR:   return "ERROR";
        case LL_WARNING: return "WARNING";
        case LL_INFO:    return "INFO";
        case LL_NOTICE:  return "NOTICE";
        case LL_DEBUG:   return "DEBUG";
    }
    return "?";
}

static int level_to_syslog_level(enum loglevel level){
    switch (level) {
        case LL_FATAL:   return LOG_CRIT;
        case LL_ERROR:   return LOG_ERR;
        case LL_WARNING: return LOG_WARNING;
        case LL_NOTICE:  return LOG_NOTICE;
        case LL_INFO:    return LOG_INFO;
        default:         return LOG_DEBUG;
    }
}

void log_enable_syslog(void){
    if (!log_syslog) {
        openlog("devagentd", LOG_PID, 0);
        log_syslog = 1;
    }
}

void log_disable_syslog(void){
    if (log_syslog) {
        closelog();
        log_syslog = 0;
    }
}

void devagentd_log(enum loglevel level, const char *fmt, ...){
    char msg[2048];
    va_list ap;

    if (level > log_level)
        return;

    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    if (log_syslog) {
        syslog(level_to_syslog_level(level), "[%s] %s", level_tag(level), msg);
    } else {
        struct timeval ts = {};
        struct tm tp = {};
        char tstr[32] = {};

        gettimeofday(&ts, NULL);
        localtime_r(&ts.tv_sec, &tp);
        strftime(tstr, sizeof(tstr), "%H:%M:%S", &tp);

        //single write so concurrent lines don't interleave
        fprintf(stderr, "[%s.%03d][%s] %s\n", tstr, (int)(ts.tv_usec / 1000), level_tag(level), msg);
        fflush(stderr);
    }
}
