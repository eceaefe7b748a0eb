#ifndef PORTAL_TRANSFER_SLAVE_HPP
#define PORTAL_TRANSFER_SLAVE_HPP

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "network/socket.hpp"
#include "protocol/messages.hpp"

namespace portal {
namespace transfer {

/*
  Slave
  --------------------------------
  The receiver role. Consumes requests from one connection, answers each with
  exactly one response before reading the next, and materializes a file only
  after its reassembled content matches the digest announced in FileMetadata.

  Per file_id:
      Absent --FileMetadata--> Open --FileFragment--> Open
      Open --EndOfFile (any outcome) / DropFile--> Absent

  Transfer state lives in this object only, so it never outlives or crosses
  a connection. Completed files are written to "<dir>/.<name>.part" and then
  renamed over "<dir>/<name>".
*/

class Slave {
  public:
    explicit Slave(std::string storageDirectory);

    /**
     * @brief Serve one connection until the peer closes it.
     * @throw protocol::PortalError on decode or transport failure.
     */
    void run(const network::Stream& stream);

    /**
     * @brief Apply one request to the transfer state and produce its response.
     *        Never throws for protocol-level problems.
     */
    protocol::Response handleRequest(const protocol::Request& request);

    /// Number of transfers currently Open.
    size_t openTransfers() const { return transfers_.size(); }

    bool hasTransfer(uint8_t fileId) const { return transfers_.count(fileId) != 0; }

    const std::string& storageDirectory() const { return storageDirectory_; }

    /**
     * @brief Reduce a sender-supplied display name to a single path component.
     *        "a/b/c.txt" -> "c.txt"; "", "." and ".." -> "Untitled".
     */
    static std::string sanitizeFileName(const std::string& displayName);

  private:
    struct TransferState {
        std::string fileName;
        std::string contentHash;
        std::vector<std::pair<uint32_t, std::vector<uint8_t>>> fragments; ///< arrival order
    };

    protocol::Response onMetadata(const protocol::FileMetadata& msg);
    protocol::Response onFragment(const protocol::FileFragment& msg);
    protocol::Response onEndOfFile(const protocol::EndOfFile& msg);
    protocol::Response onDropFile(const protocol::DropFile& msg);

    /// Write atomically; false on any filesystem failure.
    bool commitFile(const std::string& fileName, const std::vector<uint8_t>& content);

    std::string storageDirectory_;
    std::unordered_map<uint8_t, TransferState> transfers_;
};

} // namespace transfer
} // namespace portal

#endif // PORTAL_TRANSFER_SLAVE_HPP
