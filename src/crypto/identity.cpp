#include "crypto/identity.hpp"
#include "crypto/hasher.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>

namespace {

// Helper deleters for unique_ptr
struct BIO_Deleter { void operator()(BIO* b) { BIO_free_all(b); } };
struct EVP_PKEY_Deleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

std::vector<uint8_t> export_public_key(EVP_PKEY* pkey) {
    std::unique_ptr<BIO, BIO_Deleter> bio_pub(BIO_new(BIO_s_mem()));
    if (!bio_pub || i2d_PUBKEY_bio(bio_pub.get(), pkey) <= 0) {
        throw KnapsackError(ErrorKind::IoError, "export_public_key", openssl_error());
    }
    char* pub_data = nullptr;
    long pub_len = BIO_get_mem_data(bio_pub.get(), &pub_data);
    return std::vector<uint8_t>(pub_data, pub_data + pub_len);
}

} // namespace

Identity::Identity(std::string private_key_pem, std::vector<uint8_t> public_key_der)
    : private_key_pem_(std::move(private_key_pem)),
      public_key_der_(std::move(public_key_der)),
      peer_id_(Hasher::sha256(public_key_der_)) {}

Identity Identity::generate() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), EVP_PKEY_CTX_free);

    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
        throw KnapsackError(ErrorKind::IoError, "Identity::generate", "keygen init: " + openssl_error());
    }

    EVP_PKEY* pkey_raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey_raw) <= 0) {
        throw KnapsackError(ErrorKind::IoError, "Identity::generate", "keygen: " + openssl_error());
    }
    std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey(pkey_raw);

    std::unique_ptr<BIO, BIO_Deleter> bio_priv(BIO_new(BIO_s_mem()));
    if (!bio_priv || PEM_write_bio_PrivateKey(bio_priv.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw KnapsackError(ErrorKind::IoError, "Identity::generate", "PEM export: " + openssl_error());
    }
    char* priv_data = nullptr;
    long priv_len = BIO_get_mem_data(bio_priv.get(), &priv_data);
    std::string private_key_pem(priv_data, priv_len);

    return Identity(std::move(private_key_pem), export_public_key(pkey.get()));
}

Identity Identity::from_private_key_pem(const std::string& private_key_pem) {
    std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size())));
    std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        throw KnapsackError(ErrorKind::IoError, "Identity::from_private_key_pem", openssl_error());
    }
    return Identity(private_key_pem, export_public_key(pkey.get()));
}

Identity Identity::load_or_create(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::ifstream in(path);
        if (!in) {
            throw KnapsackError(ErrorKind::IoError, "Identity::load_or_create", "cannot read " + path.string());
        }
        std::stringstream ss;
        ss << in.rdbuf();
        Identity identity = from_private_key_pem(ss.str());
        LOG_DEBUG("Loaded identity ", Hasher::short_hex(identity.peer_id()), " from ", path.string());
        return identity;
    }

    Identity identity = generate();
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw KnapsackError(ErrorKind::IoError, "Identity::load_or_create", "cannot write " + path.string());
    }
    out << identity.private_key_pem();
    std::error_code ec;
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Could not restrict permissions on ", path.string(), ": ", ec.message());
    }
    LOG_INFO("Generated new identity ", Hasher::short_hex(identity.peer_id()), " at ", path.string());
    return identity;
}
