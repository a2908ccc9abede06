#include "connection.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

namespace Replibench {

namespace {

// Resolves `address` (dotted quad or host name) into an IPv4 socket address.
bool ResolveAddress(const std::string& address, int port, sockaddr_in* out) {
	memset(out, 0, sizeof(*out));
	out->sin_family = AF_INET;
	out->sin_port = htons(port);
	const std::string host = address.empty() ? "127.0.0.1" : address;
	if (inet_pton(AF_INET, host.c_str(), &out->sin_addr) == 1) {
		return true;
	}

	addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_STREAM;
	addrinfo* res = nullptr;
	int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
	if (rc != 0 || res == nullptr) {
		LOG(ERROR) << "Failed to resolve " << host << ": " << gai_strerror(rc);
		return false;
	}
	out->sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
	freeaddrinfo(res);
	return true;
}

// Connects with a bounded wait, then switches the socket back to blocking mode.
int ConnectWithTimeout(const sockaddr_in& server_addr, int timeout_ms) {
	int sock = socket(AF_INET, SOCK_STREAM, 0);
	if (sock < 0) {
		LOG(ERROR) << "Socket creation failed: " << strerror(errno);
		return -1;
	}

	int flags = fcntl(sock, F_GETFL, 0);
	if (flags == -1 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) == -1) {
		LOG(ERROR) << "fcntl failed: " << strerror(errno);
		close(sock);
		return -1;
	}

	if (connect(sock, reinterpret_cast<const sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
		if (errno != EINPROGRESS) {
			LOG(ERROR) << "Connect failed: " << strerror(errno);
			close(sock);
			return -1;
		}
		pollfd pfd{sock, POLLOUT, 0};
		int ready = poll(&pfd, 1, timeout_ms);
		if (ready <= 0) {
			LOG(ERROR) << "Connect timed out after " << timeout_ms << " ms";
			close(sock);
			return -1;
		}
		int so_error = 0;
		socklen_t len = sizeof(so_error);
		if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
			LOG(ERROR) << "Connect failed: " << strerror(so_error ? so_error : errno);
			close(sock);
			return -1;
		}
	}

	if (fcntl(sock, F_SETFL, flags) == -1) {
		LOG(ERROR) << "fcntl F_SETFL failed: " << strerror(errno);
		close(sock);
		return -1;
	}

	// Batches are small and latency sensitive
	int flag = 1;
	if (setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) != 0) {
		LOG(ERROR) << "setsockopt(TCP_NODELAY) failed: " << strerror(errno);
		close(sock);
		return -1;
	}
	return sock;
}

} // namespace

std::unique_ptr<Connection> Connection::Dial(const std::string& address, int port, int timeout_ms) {
	sockaddr_in server_addr;
	if (!ResolveAddress(address, port, &server_addr)) {
		throw std::runtime_error("Invalid replica address: " + address);
	}
	int sock = ConnectWithTimeout(server_addr, timeout_ms);
	if (sock < 0) {
		throw std::runtime_error("Error connecting to replica at " + address + ":" + std::to_string(port));
	}
	VLOG(1) << "Connected to replica " << address << ":" << port << " fd=" << sock;
	return std::make_unique<Connection>(sock);
}

Connection::Connection(int fd)
	: fd_(fd),
	  socket_in_(fd),
	  socket_out_(fd),
	  input_(&socket_in_),
	  output_(&socket_out_) {}

Connection::~Connection() {
	// Drain the outbound buffer while the descriptor is still ours.
	output_.Flush();
	if (fd_ >= 0) {
		close(fd_);
		fd_ = -1;
	}
}

bool Connection::Flush() {
	return output_.Flush();
}

void Connection::Shutdown() {
	if (fd_ >= 0 && shutdown(fd_, SHUT_RDWR) < 0 && errno != ENOTCONN) {
		LOG(WARNING) << "shutdown failed on fd " << fd_ << ": " << strerror(errno);
	}
}

int Connection::SocketInput::Read(void* buffer, int size) {
	while (true) {
		ssize_t n = recv(fd_, buffer, size, 0);
		if (n >= 0) {
			return static_cast<int>(n);
		}
		if (errno == EINTR) {
			continue;
		}
		VLOG(1) << "recv failed on fd " << fd_ << ": " << strerror(errno);
		return -1;
	}
}

bool Connection::SocketOutput::Write(const void* buffer, int size) {
	const char* p = static_cast<const char*>(buffer);
	while (size > 0) {
		ssize_t n = send(fd_, p, size, MSG_NOSIGNAL);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(ERROR) << "send failed on fd " << fd_ << ": " << strerror(errno);
			return false;
		}
		p += n;
		size -= static_cast<int>(n);
	}
	return true;
}

} // namespace Replibench
