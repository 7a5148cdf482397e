#ifndef CHANARC_PLATFORM_COMPAT_H_
#define CHANARC_PLATFORM_COMPAT_H_

#ifdef _WIN32
    #error "chanarc requires a POSIX platform (flock, fsync, rename over open files)"
#else
    #include <unistd.h>
    #include <fcntl.h>
    #include <sys/file.h>
    #include <sys/stat.h>
    #include <sys/types.h>

#endif

#endif // CHANARC_PLATFORM_COMPAT_H_
