// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_0918273640192837461
#define OPEN_SSL_H_0918273640192837461

#include <memory>
#include "sys_error.h"
#include "socket.h"

struct ssl_ctx_st; //= SSL_CTX
struct ssl_st;     //= SSL


namespace fse
{
//init OpenSSL before use!
void openSslInit();

std::string formatLastOpenSSLError(const char* functionName);


enum class TlsRole
{
    client,
    server
};

enum class TlsVersion
{
    tls12,
    tls13
};


//resumable TLS session material (e.g. FTPS control channel session reused by data connections)
class TlsSession;


class TlsContext //= SSL_CTX: shared by all connections that may resume each other's sessions
{
public:
    explicit TlsContext(TlsRole role); //throw SysError
    ~TlsContext();

    TlsRole getRole() const { return role_; }

    //client: verify certificate chain against CA file (PEM); default: chain is not verified
    void setTrustedCaFile(const std::string& caFilePath); //throw SysError

    //server: PEM-encoded certificate + private key
    void setCertificate(const std::string& certPem, const std::string& privateKeyPem); //throw SysError

    void setMaxProtocolVersion(TlsVersion version); //throw SysError

    ssl_ctx_st* get() { return ctx_; }

private:
    TlsContext           (const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    const TlsRole role_;
    ssl_ctx_st* ctx_ = nullptr;
};


class TlsStream //TLS over a connected (blocking) socket; socket ownership stays with caller
{
public:
    //client: SNI + session resumption (optional); server: serverName and resumeSession are ignored
    TlsStream(TlsContext& ctx, SocketType socket,
              const std::string& serverName,
              const std::shared_ptr<TlsSession>& resumeSession); //throw SysError: runs handshake
    ~TlsStream();

    size_t tryRead (      void* buffer, size_t bytesToRead ); //throw SysError; may return short, only 0 means EOF!
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw SysError; may return short! CONTRACT: bytesToWrite > 0

    bool hasPendingData() const; //decrypted bytes buffered by OpenSSL: not visible to poll()

    void shutdown(); //throw SysError; send close_notify (unidirectional)

    std::shared_ptr<TlsSession> getSession() const; //nullptr if not (yet) resumable
    bool isSessionReused() const;

    //X.509 identity check: DNS name or IP address literal
    bool peerMatchesHost(const std::string& host) const; //throw SysError

    std::string getProtocolVersion() const; //e.g. "TLSv1.3"
    std::string getCipherName() const;

private:
    TlsStream           (const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    ssl_st* ssl_ = nullptr;
    bool shutdownSent_ = false;
};
}

#endif //OPEN_SSL_H_0918273640192837461
