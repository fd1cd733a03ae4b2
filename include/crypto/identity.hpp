#ifndef KNAPSACK_IDENTITY_HPP
#define KNAPSACK_IDENTITY_HPP

#include <vector>
#include <string>
#include <filesystem>

#include "../video/video_metadata.hpp" // For hash_t

/**
 * @brief The node's EC P-256 key pair and the peer id derived from it.
 *
 * The peer id is the SHA-256 of the DER-encoded public key, so it stays
 * stable for as long as the key file is kept.
 */
class Identity {
public:
    // Generates a fresh key pair. Throws KnapsackError(IoError) if OpenSSL fails.
    static Identity generate();

    // Loads the PEM private key at path, or generates one and writes it there.
    static Identity load_or_create(const std::filesystem::path& path);

    // Rebuilds an identity from a PEM private key.
    static Identity from_private_key_pem(const std::string& private_key_pem);

    const hash_t& peer_id() const { return peer_id_; }
    const std::string& private_key_pem() const { return private_key_pem_; }
    const std::vector<uint8_t>& public_key_der() const { return public_key_der_; }

private:
    Identity(std::string private_key_pem, std::vector<uint8_t> public_key_der);

    std::string private_key_pem_;
    std::vector<uint8_t> public_key_der_;
    hash_t peer_id_;
};

#endif // KNAPSACK_IDENTITY_HPP
