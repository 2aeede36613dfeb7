#include <slate/utils/network_utils.h>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#else
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cerrno>
#endif

namespace slate {
namespace utils {

#ifdef _WIN32

static bool try_connect(const addrinfo* ai, int timeout_ms) {
    SOCKET sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock == INVALID_SOCKET) {
        return false;
    }

    u_long non_blocking = 1;
    ioctlsocket(sock, FIONBIO, &non_blocking);

    bool connected = false;
    int result = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
    if (result == 0) {
        connected = true;
    } else if (WSAGetLastError() == WSAEWOULDBLOCK) {
        fd_set write_fds;
        fd_set error_fds;
        FD_ZERO(&write_fds);
        FD_ZERO(&error_fds);
        FD_SET(sock, &write_fds);
        FD_SET(sock, &error_fds);

        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        if (select(0, nullptr, &write_fds, &error_fds, &tv) > 0 &&
            FD_ISSET(sock, &write_fds) && !FD_ISSET(sock, &error_fds)) {
            connected = true;
        }
    }

    closesocket(sock);
    return connected;
}

bool NetworkUtils::can_connect(const std::string& host, int port, int timeout_ms) {
    if (port < 1 || port > 65535) {
        return false;
    }

    WSADATA wsa_data;
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
        return false;
    }

    addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    bool connected = false;
    addrinfo* results = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results) == 0) {
        // "localhost" may resolve to ::1 first while the listener is on 127.0.0.1
        for (addrinfo* ai = results; ai && !connected; ai = ai->ai_next) {
            connected = try_connect(ai, timeout_ms);
        }
        freeaddrinfo(results);
    }

    WSACleanup();
    return connected;
}

#else

static bool try_connect(const addrinfo* ai, int timeout_ms) {
    int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return false;
    }

    int flags = fcntl(sock, F_GETFL);
    if (flags != -1) {
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);
    }

    bool connected = false;
    int result = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (result == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd = {};
        pfd.fd = sock;
        pfd.events = POLLOUT;

        if (poll(&pfd, 1, timeout_ms) > 0) {
            // Writable does not mean connected; the pending error says which
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                connected = true;
            }
        }
    }

    close(sock);
    return connected;
}

bool NetworkUtils::can_connect(const std::string& host, int port, int timeout_ms) {
    if (port < 1 || port > 65535) {
        return false;
    }

    addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results) != 0) {
        return false;
    }

    // "localhost" may resolve to ::1 first while the listener is on 127.0.0.1
    bool connected = false;
    for (addrinfo* ai = results; ai && !connected; ai = ai->ai_next) {
        connected = try_connect(ai, timeout_ms);
    }
    freeaddrinfo(results);
    return connected;
}

#endif

} // namespace utils
} // namespace slate
