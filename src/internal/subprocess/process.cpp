// Platform-agnostic process implementation
// Uses conditional compilation to select platform-specific implementation

#ifdef _WIN32
    #error "mcpcli only supports POSIX platforms"
#else
    #include "process_posix.cpp"
#endif
