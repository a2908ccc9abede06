#pragma once

#include <memory>
#include <string>

#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

namespace Replibench {

/**
 * One long-lived TCP stream to a replica, split by direction.
 *
 * The outbound half is used by the issuer thread only and the inbound half by
 * the response reader only, so the two halves need no locking between them.
 */
class Connection {
	public:
		/**
		 * Connects to address:port. Throws std::runtime_error when the replica
		 * cannot be reached; a run never starts on a broken connection.
		 */
		static std::unique_ptr<Connection> Dial(const std::string& address, int port, int timeout_ms);

		/**
		 * Takes ownership of a connected stream socket (tests pass one end of a
		 * socketpair).
		 */
		explicit Connection(int fd);
		~Connection();

		Connection(const Connection&) = delete;
		Connection& operator=(const Connection&) = delete;

		google::protobuf::io::ZeroCopyOutputStream* output() { return &output_; }
		google::protobuf::io::ZeroCopyInputStream* input() { return &input_; }

		/// Pushes buffered outbound bytes to the socket. False on a write error.
		bool Flush();

		/**
		 * Shuts both directions down. Wakes a reader blocked on the socket so
		 * it observes end of stream; the descriptor stays open until destruction.
		 */
		void Shutdown();

		int fd() const { return fd_; }

	private:
		class SocketInput : public google::protobuf::io::CopyingInputStream {
			public:
				explicit SocketInput(int fd) : fd_(fd) {}
				int Read(void* buffer, int size) override;
			private:
				int fd_;
		};

		class SocketOutput : public google::protobuf::io::CopyingOutputStream {
			public:
				explicit SocketOutput(int fd) : fd_(fd) {}
				bool Write(const void* buffer, int size) override;
			private:
				int fd_;
		};

		int fd_;
		SocketInput socket_in_;
		SocketOutput socket_out_;
		google::protobuf::io::CopyingInputStreamAdaptor input_;
		google::protobuf::io::CopyingOutputStreamAdaptor output_;
};

} // namespace Replibench
