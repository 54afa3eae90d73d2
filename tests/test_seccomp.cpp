#include "test_common.h"
#include "codemode/seccomp.h"

#include <cerrno>
#include <csignal>
#include <functional>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace codemode;

static const int kInstallFailed = 77;

// Runs body in a filtered child. Returns the raw wait status.
static int run_filtered(const std::function<int()>& body) {
    pid_t pid = fork();
    if (pid < 0) die("fork failed");
    if (pid == 0) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) _exit(kInstallFailed);
        if (!install_seccomp_filter().empty()) _exit(kInstallFailed);
        _exit(body());
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

static bool exited_with(int status, int code) {
    return WIFEXITED(status) && WEXITSTATUS(status) == code;
}

static bool killed_by_sigsys(int status) {
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS;
}

int main() {
    if (!seccomp_available()) {
        std::cerr << "test_seccomp: seccomp not available, skipping" << std::endl;
        return 0;
    }

    // Test 1: the filter installs and ordinary I/O keeps working
    {
        int st = run_filtered([] {
            const char msg[] = "filtered child alive\n";
            if (write(STDERR_FILENO, msg, sizeof(msg) - 1) < 0) return 1;
            (void)getpid();
            return 0;
        });
        if (exited_with(st, kInstallFailed)) {
            std::cerr << "test_seccomp: filter rejected by kernel, skipping" << std::endl;
            return 0;
        }
        expect_true(exited_with(st, 0), "allowed syscalls should work");
    }

    // Test 2: sockets are fatal
    {
        int st = run_filtered([] {
            (void)socket(AF_INET, SOCK_STREAM, 0);
            return 0;
        });
        expect_true(killed_by_sigsys(st), "socket() should kill with SIGSYS");
    }

    // Test 3: spawning processes is fatal
    {
        int st = run_filtered([] {
            pid_t p = fork();
            if (p == 0) _exit(0);
            return 0;
        });
        expect_true(killed_by_sigsys(st), "fork() should kill with SIGSYS");
    }

    // Test 4: opening for write fails with EACCES instead of killing
    {
        int st = run_filtered([] {
            int fd = open("/tmp/codemode_test_seccomp_write", O_WRONLY | O_CREAT, 0600);
            if (fd >= 0) return 1;
            return errno == EACCES ? 0 : 2;
        });
        expect_true(exited_with(st, 0), "write open should fail with EACCES");
    }

    // Test 5: read-only opens still succeed
    {
        int st = run_filtered([] {
            int fd = open("/dev/null", O_RDONLY);
            if (fd < 0) return 1;
            close(fd);
            return 0;
        });
        expect_true(exited_with(st, 0), "read-only open should be allowed");
    }

    // Test 6: making memory executable is fatal, plain protection changes are not
    {
        int st = run_filtered([] {
            void* p = mmap(nullptr, 4096, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (p == MAP_FAILED) return 1;
            if (mprotect(p, 4096, PROT_READ) != 0) return 2;
            return 0;
        });
        expect_true(exited_with(st, 0), "mprotect without PROT_EXEC allowed");

        st = run_filtered([] {
            void* p = mmap(nullptr, 4096, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (p == MAP_FAILED) return 1;
            (void)mprotect(p, 4096, PROT_READ | PROT_EXEC);
            return 0;
        });
        expect_true(killed_by_sigsys(st), "mprotect with PROT_EXEC should kill");
    }

    // Test 7: executable mappings are fatal too
    {
        int st = run_filtered([] {
            (void)mmap(nullptr, 4096, PROT_READ | PROT_EXEC, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            return 0;
        });
        expect_true(killed_by_sigsys(st), "mmap with PROT_EXEC should kill");
    }

    std::cerr << "test_seccomp: ALL PASSED" << std::endl;
    return 0;
}
