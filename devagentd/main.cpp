//
//  main.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "Agent.hpp"
#include "sysconf/sysconf.hpp"

#include <libgeneral/macros.h>
#include <libgeneral/Event.hpp>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <getopt.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string>

extern "C"{
#ifdef HAVE_LIBIMOBILEDEVICE
#include <libimobiledevice/libimobiledevice.h>
#endif
};

#undef error //errors will be printed as fatal for this file
#define error(a ...) devagentd_log(LL_FATAL,a)


static const char *lockfile = "/var/run/devagentd.pid";

static tihmstar::Event wakeEvent;
static volatile sig_atomic_t terminateRequested = 0;
static volatile sig_atomic_t statusRequested = 0;
static Config *gConfig = nullptr;
static Agent *agent = nullptr;
static int report_to_parent = 0;
static int daemon_pipe = 0;

#ifdef DEBUG
static int verbose = LL_DEBUG;
#else
static int verbose = 0;
#endif


static void handle_signal(int sig) noexcept{
    static int ctrlcCounter = 0;
    if (sig == SIGUSR1) {
        statusRequested = 1;
    }else{
        if (ctrlcCounter++ == 5){
            fatal("forcefully terminating program!");
            exit(2);
        }
        terminateRequested = sig;
    }
    wakeEvent.notifyAll();
}

static void set_signal_handlers(void){
    assure(signal(SIGINT, handle_signal)  != SIG_ERR);
    assure(signal(SIGQUIT, handle_signal) != SIG_ERR);
    assure(signal(SIGTERM, handle_signal) != SIG_ERR);
    assure(signal(SIGUSR1, handle_signal) != SIG_ERR);

    assure(signal(SIGPIPE, SIG_IGN) != SIG_ERR);
}


/**
 * make this program run detached from the current console
 */
static int daemonize(void) noexcept{
    int err = 0;
    ssize_t res = 0;
    pid_t pid = 0;
    pid_t sid = 0;
    int pfd[2] = {};

    // already a daemon
    if (getppid() == 1)
        return 0;

    cretassure(!(res = pipe(pfd)), "pipe() failed");
    cretassure((pid = fork()) >=0, "fork() failed");

    if (pid > 0) {
        // exit parent process
        int status;
        close(pfd[1]);

        if((res = read(pfd[0],&status,sizeof(int))) != sizeof(int)) {
            fprintf(stderr, "devagentd: ERROR: Failed to get init status from child, check syslog for messages.\n");
            exit(1);
        }
        if(status != 0)
            fprintf(stderr, "devagentd: ERROR: Child process exited with error %d, check syslog for messages.\n", status);
        exit(status);
    }
    // child, fork once more after becoming session leader

    daemon_pipe = pfd[1];
    close(pfd[0]);
    report_to_parent = 1;

    cretassure((sid = setsid()) >=0, "setsid() failed");

    cretassure((pid = fork()) >=0, "fork() failed (second)");

    if (pid > 0) {
        close(daemon_pipe);
        exit(0);
    }

    cretassure((res = chdir("/")) >=0, "chdir() failed");

    cretassure(freopen("/dev/null", "r", stdin), "Redirection of stdin failed");
    cretassure(freopen("/dev/null", "r", stdout), "Redirection of stdout failed");

error:
    return -err;
}


static void notify_parent(int status){
    report_to_parent = 0;
    assure(write(daemon_pipe, &status, sizeof(int)) == sizeof(int));
    close(daemon_pipe);
    retassure(freopen("/dev/null", "w", stderr),"Redirection of stderr failed.");
}

static struct flock whole_file_lock(){
    struct flock lock = {};
    lock.l_type = F_WRLCK;
    lock.l_whence = SEEK_SET;
    return lock;
}

/**
 * returns true if another process holds the pidfile lock, its pid is written to outPid
 */
static bool pidfile_holder(pid_t *outPid) noexcept{
    int fd = -1;
    struct flock lock = whole_file_lock();
    if ((fd = open(lockfile, O_RDONLY|O_CREAT, 0644)) == -1) {
        warning("Could not open pidfile %s (%s)", lockfile, strerror(errno));
        return false;
    }
    fcntl(fd, F_GETLK, &lock);
    close(fd);
    if (lock.l_type != F_UNLCK) {
        *outPid = lock.l_pid;
        return true;
    }
    unlink(lockfile);
    return false;
}

static int pidfile_create(){
    int fd = -1;
    struct flock lock = whole_file_lock();
    cleanup([&]{
        safeClose(fd);
    });
    std::string pid = std::to_string(getpid());

    retassure((fd = open(lockfile, O_WRONLY|O_CREAT|O_TRUNC|O_EXCL, 0644)) != -1, "Could not open pidfile %s", lockfile);
    retassure(fcntl(fd, F_SETLK, &lock) >=0, "Pidfile locking failed!");
    retassure(write(fd, pid.data(), pid.size()) == (ssize_t)pid.size(), "Could not write pidfile!");
    {
        int ret = fd; fd = -1;
        return ret;
    }
}

static void usage(){
    printf("Usage: %s [OPTIONS]\n", PACKAGE_NAME);
    printf("Supervise attached test devices, their automation sessions and plugin processes.\n\n");
    printf("  -h, --help\t\t\tPrint this message.\n");
    printf("  -c, --config=FILE\t\tRead configuration from FILE (default %s).\n", DEFAULT_CONFIG_PATH);
    printf("  -d, --daemonize\t\tDo daemonize\n");
    printf("  -l, --logfile=LOGFILE\t\tLog (append) to LOGFILE instead of stderr or syslog.\n");
    printf("  -v, --verbose\t\t\tBe verbose (use twice or more to increase).\n");
    printf("  -V, --version\t\t\tPrint version information and exit.\n");
    printf("      --debug\t\t\tEnable debug logging\n");
    printf("      --no-listener\t\tDo not start device detection\n");
    printf("      --install-folder=DIR\tOverride the install folder from the config\n");
    printf("\n");
    printf("Send SIGUSR1 to log a status summary.\n");
}

static void parse_opts(int argc, const char **argv, bool configOnly){
    static struct option longopts[] = {
        {"help",                    no_argument,        NULL, 'h'},
        {"config",                  required_argument,  NULL, 'c'},
        {"daemonize",               no_argument,        NULL, 'd'},
        {"logfile",                 required_argument,  NULL, 'l'},
        {"verbose",                 no_argument,        NULL, 'v'},
        {"version",                 no_argument,        NULL, 'V'},

        {"debug",                   no_argument,        NULL,  0 },
        {"no-listener",             no_argument,        NULL,  0 },
        {"install-folder",          required_argument,  NULL,  0 },
        {NULL,                      0,                  NULL,  0 }
    };
    int optindex = 0;
    int opt = 0;

    const char* opts_spec = "hc:dl:vV";

    optind = 1;
    while ((opt = getopt_long(argc, (char* const *)argv, opts_spec, longopts, &optindex)) >= 0) {
        if (configOnly) {
            //first pass only picks up the config path, everything else overrides the loaded config
            if (opt == 'c') gConfig->configPath = optarg;
            continue;
        }
        switch (opt) {
            case 0: //long opts
            {
                std::string curopt = longopts[optindex].name;

                if (curopt == "debug") {
                    gConfig->debugLevel++;
                }else if (curopt == "no-listener") {
                    info("Manually disabling device listener");
                    gConfig->enableDeviceListener = false;
                }else if (curopt == "install-folder") {
                    gConfig->installFolder = optarg;
                }
            }
                break;
            case 'h':
                usage();
                exit(0);
                break;
            case 'c':
                break;
            case 'd':
                gConfig->daemonize = true;
                break;
            case 'l':
                if (!*optarg) {
                    fatal("ERROR: --logfile requires a non-empty filename");
                    usage();
                    exit(2);
                }
                if (gConfig->useLogfile) {
                    fatal("ERROR: --logfile cannot be used multiple times");
                    exit(2);
                }
                if (!freopen(optarg, "a", stderr)) {
                    fatal("ERROR: fdreopen: %s", strerror(errno));
                } else {
                    gConfig->useLogfile = true;
                }
                break;
            case 'v':
                ++verbose;
                break;
            case 'V':
                printf("%s\n", VERSION_STRING);
                exit(0);

            default:
                usage();
                exit(2);
        }
    }
}


int main(int argc, const char * argv[]) {
    int err = 0;
    int lfd = -1;
    pid_t holder = 0;

    gConfig = new Config();
    parse_opts(argc,argv,true);
    try{
        gConfig->load();
    }catch(tihmstar::exception &e){
        fatal("Could not load config with error=%d (%s)",e.code(),e.what());
        creterror("failed to load config!");
    }

    parse_opts(argc,argv,false);

    try{
        gConfig->validate();
    }catch(tihmstar::exception &e){
        creterror("invalid config with error=%d (%s)",e.code(),e.what());
    }

    if (gConfig->debugLevel) {
        info("debuglevel set to %d",gConfig->debugLevel);
#ifdef HAVE_LIBIMOBILEDEVICE
        idevice_set_debug_level(gConfig->debugLevel);
#endif
    }

    if (gConfig->daemonize && !gConfig->useLogfile) {
        verbose += LL_INFO;
        debug("enabling syslog");
        log_enable_syslog();
    } else {
        verbose += LL_NOTICE;
    }

    // set log level to specified verbosity
    log_level = verbose;
    info("starting %s", VERSION_STRING);

    set_signal_handlers();

    cretassure(!pidfile_holder(&holder), "Another instance is already running (pid %d). exiting.", holder);

    if (gConfig->daemonize) {
        if (daemonize() < 0) {
            fprintf(stderr, "devagentd: FATAL: Could not daemonize!\n");
            creterror("Could not daemonize!");
        }
    }

    try{
        lfd = pidfile_create();
    }catch (tihmstar::exception &e){
        creterror("failed to create pidfile with error=%d (%s)",e.code(),e.what());
    }

    //starting
    try{
        agent = new Agent(*gConfig);
        agent->start();
    }catch (tihmstar::exception &e){
        creterror("failed to start Agent with error=%d (%s)",e.code(),e.what());
    }

    if (gConfig->enableDeviceListener){
        try{
            agent->spawnIOSDeviceManager();
            info("Inited IOSDeviceManager");
        }catch (tihmstar::exception &e){
            fatal("failed to spawnIOSDeviceManager with error=%d (%s)",e.code(),e.what());
        }
        if (!agent->hasDeviceManager()){
            warning("No device detector is running, only plugins will be supervised");
        }
    }else{
        info("Device listener disabled by config or commandline!");
    }

    notice("Initialization complete");
    if (report_to_parent){
        try{
            notify_parent(0);
        }catch(tihmstar::exception &e){
            creterror("notify_parent failed with error=%d (%s)",e.code(),e.what());
        }
    }

    //block thread
    while (true) {
        uint64_t wevent = wakeEvent.getNextEvent();
        if (statusRequested) {
            statusRequested = 0;
            info("Status: %s",agent->statusSummary().c_str());
        }
        if (terminateRequested) {
            info("Caught signal %d, exiting", (int)terminateRequested);
            break;
        }
        wakeEvent.waitForEvent(wevent);
    }

error:
    if (err){
        if (report_to_parent){
            try{
                notify_parent(err);
            }catch(tihmstar::exception &e){
                fatal("notify_parent failed with error=%d (%s)",e.code(),e.what());
            }
        }
    }
    notice("main reached cleanup");
    if (agent){
        Agent *a = agent; agent = nullptr;
        delete a;
    }
    if (gConfig){
        Config *cfg = gConfig; gConfig = nullptr;
        delete cfg;
    }
    if (lfd > 0){
        close(lfd);
        unlink(lockfile);
    }
    notice("done!");
    return err;
}
