// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps_test_server.h"
#include <deque>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <fse/time.h>
#include <fse/extra_log.h>

using namespace fse;
using namespace ftps;
using namespace ftps::test;


namespace
{
//self-signed ECDSA P-256 certificate, valid for one day
std::pair<std::string /*certPem*/, std::string /*keyPem*/> createSelfSignedCertificate(const std::string& subjectAltNames) //throw SysError
{
    EVP_PKEY* pkey = ::EVP_EC_gen("P-256");
    if (!pkey)
        throw SysError(formatLastOpenSSLError("EVP_EC_gen"));
    FSE_ON_SCOPE_EXIT(::EVP_PKEY_free(pkey));

    X509* cert = ::X509_new();
    if (!cert)
        throw SysError(formatLastOpenSSLError("X509_new"));
    FSE_ON_SCOPE_EXIT(::X509_free(cert));

    if (::X509_set_version(cert, X509_VERSION_3) != 1)
        throw SysError(formatLastOpenSSLError("X509_set_version"));

    if (::ASN1_INTEGER_set(::X509_get_serialNumber(cert), 1) != 1)
        throw SysError(formatLastOpenSSLError("ASN1_INTEGER_set"));

    if (!::X509_gmtime_adj(::X509_getm_notBefore(cert), -3600) ||
        !::X509_gmtime_adj(::X509_getm_notAfter (cert), 24 * 3600))
        throw SysError(formatLastOpenSSLError("X509_gmtime_adj"));

    if (::X509_set_pubkey(cert, pkey) != 1)
        throw SysError(formatLastOpenSSLError("X509_set_pubkey"));

    X509_NAME* name = ::X509_get_subject_name(cert); //owned by cert
    if (::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("FtpsEngine Test Server"), -1, -1, 0) != 1)
        throw SysError(formatLastOpenSSLError("X509_NAME_add_entry_by_txt"));

    if (::X509_set_issuer_name(cert, name) != 1)
        throw SysError(formatLastOpenSSLError("X509_set_issuer_name"));

    X509V3_CTX v3Ctx = {};
    X509V3_set_ctx_nodb(&v3Ctx);
    ::X509V3_set_ctx(&v3Ctx, cert, cert, nullptr, nullptr, 0);

    X509_EXTENSION* ext = ::X509V3_EXT_conf_nid(nullptr, &v3Ctx, NID_subject_alt_name, subjectAltNames.c_str());
    if (!ext)
        throw SysError(formatLastOpenSSLError("X509V3_EXT_conf_nid"));
    FSE_ON_SCOPE_EXIT(::X509_EXTENSION_free(ext));

    if (::X509_add_ext(cert, ext, -1) != 1)
        throw SysError(formatLastOpenSSLError("X509_add_ext"));

    if (::X509_sign(cert, pkey, ::EVP_sha256()) == 0)
        throw SysError(formatLastOpenSSLError("X509_sign"));

    const auto toPem = [](const char* functionName, auto writePem) //throw SysError
    {
        BIO* bio = ::BIO_new(::BIO_s_mem());
        if (!bio)
            throw SysError(formatLastOpenSSLError("BIO_new"));
        FSE_ON_SCOPE_EXIT(::BIO_free_all(bio));

        if (writePem(bio) != 1)
            throw SysError(formatLastOpenSSLError(functionName));

        char* data = nullptr;
        const long dataLen = BIO_get_mem_data(bio, &data);
        return std::string(data, static_cast<size_t>(dataLen));
    };

    return
    {
        toPem("PEM_write_bio_X509", [&](BIO* bio) { return ::PEM_write_bio_X509(bio, cert); }),
        toPem("PEM_write_bio_PrivateKey", [&](BIO* bio) { return ::PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr); })
    };
}


std::string getParentPath(const std::string& path)
{
    const std::string parent = beforeLast(path, '/', IfNotFoundReturn::none);
    return parent.empty() ? "/" : parent;
}


std::string getItemName(const std::string& path) { return afterLast(path, '/', IfNotFoundReturn::all); }


std::string formatMdtmTime(const TestFile& file)
{
    std::string output = formatTime("%Y%m%d%H%M%S", getUtcTime(file.modTime));
    if (file.modTimeMs != 0)
    {
        const std::string msStr = numberTo<std::string>(file.modTimeMs);
        output += '.' + std::string(3 - std::min<size_t>(msStr.size(), 3), '0') + msStr;
    }
    return output;
}


//"-rw-r--r-- 1 ftp ftp 1084 Jan 10  2020 name"
std::string formatUnixListLine(const std::string& name, const TestFile& file)
{
    const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    const TimeComp tc = getUtcTime(file.modTime);

    std::string day = numberTo<std::string>(tc.day);
    if (day.size() < 2)
        day = ' ' + day;

    return std::string(file.isFolder ? "drwxr-xr-x" : "-rw-r--r--") + " 1 ftp ftp " +
           numberTo<std::string>(file.isFolder ? 4096 : file.content.size()) + ' ' +
           months[tc.month - 1] + ' ' + day + "  " + numberTo<std::string>(tc.year) + ' ' + name;
}
}


class FtpsTestServer::Session
{
public:
    Session(FtpsTestServer& server, std::unique_ptr<Socket>&& socket) : server_(server), socket_(std::move(socket)) {}

    void run() //throw SysError, ThreadStopRequest
    {
        if (server_.cfg_.tlsMode == TlsMode::implicitTls)
            tls_ = std::make_unique<TlsStream>(*server_.tlsCtx_, socket_->get(), "", nullptr); //throw SysError

        sendReply(server_.cfg_.greeting); //throw SysError

        for (;;)
        {
            const std::optional<std::string> line = readLine(); //throw SysError, ThreadStopRequest
            if (!line) //client closed the connection
                return;

            if (!processCommand(*line)) //throw SysError, ThreadStopRequest
                return;
        }
    }

private:
    //false: end of session
    bool processCommand(const std::string& line) //throw SysError, ThreadStopRequest
    {
        const std::string verb = getUpperCase(beforeFirst(line, ' ', IfNotFoundReturn::all));
        const std::string args = afterFirst(line, ' ', IfNotFoundReturn::none);

        if (verb == "AUTH")
        {
            if (server_.cfg_.rejectAuthTls)
                sendReply("534 Policy requires clear text sessions.");
            else if (tls_ || !equalAsciiNoCase(args, "TLS"))
                sendReply("504 AUTH mechanism not supported.");
            else
            {
                sendReply("234 AUTH TLS successful.");
                tls_ = std::make_unique<TlsStream>(*server_.tlsCtx_, socket_->get(), "", nullptr); //throw SysError
            }
        }
        else if (!tls_) //cleartext commands are not accepted
            sendReply("530 Please login with USER and PASS over TLS.");
        else if (verb == "USER")
        {
            user_ = args;
            loggedIn_ = false;
            sendReply("331 Password required for " + args + '.');
        }
        else if (verb == "PASS")
        {
            loggedIn_ = user_ == server_.cfg_.username && args == server_.cfg_.password;
            sendReply(loggedIn_ ? "230 User logged in." : "530 Login incorrect.");
        }
        else if (verb == "QUIT")
        {
            sendReply("221 Goodbye.");
            tls_->shutdown(); //throw SysError
            return false;
        }
        else if (verb == "FEAT")
        {
            std::string reply = "211-Features:\r\n"
                                " AUTH TLS\r\n"
                                " EPSV\r\n"
                                " MDTM\r\n"
                                " MFMT\r\n";
            if (server_.cfg_.advertiseMlst)
                reply += " MLST type*;size*;modify*;unique*;\r\n";
            reply += " MODE Z\r\n"
                     " PBSZ\r\n"
                     " PROT\r\n"
                     " SIZE\r\n"
                     " UTF8\r\n"
                     "211 End";
            sendReply(reply);
        }
        else if (verb == "NOOP")
        {
            ++server_.noops_;
            sendReply("200 NOOP ok.");
        }
        else if (!loggedIn_)
            sendReply("530 Please login with USER and PASS.");
        else if (verb == "PBSZ")
            sendReply(server_.cfg_.rejectPbsz ? "503 PBSZ not allowed." : "200 PBSZ=0");
        else if (verb == "PROT")
        {
            if (server_.cfg_.rejectProt)
                sendReply("534 Protection level request denied.");
            else if (args == "P" || args == "C")
            {
                protPrivate_ = args == "P";
                sendReply("200 Protection level set to " + args + '.');
            }
            else
                sendReply("536 PROT " + args + " not supported.");
        }
        else if (verb == "TYPE")
            sendReply(args == "I" || args == "A" ? "200 Type set to " + args + '.' : "504 Type not supported.");
        else if (verb == "PWD")
            sendReply("257 \"" + replaceCpy(cwd_, "\"", "\"\"") + "\" is the current directory.");
        else if (verb == "CWD")
        {
            const std::string path = resolvePath(args);
            const std::optional<TestFile> item = path == "/" ? std::optional<TestFile>(TestFile{true}) : server_.getFile(path);
            if (item && item->isFolder)
            {
                cwd_ = path;
                sendReply("250 Directory successfully changed.");
            }
            else
                sendReply("550 Failed to change directory.");
        }
        else if (verb == "SIZE")
        {
            const std::optional<TestFile> item = server_.getFile(resolvePath(args));
            if (item && !item->isFolder)
                sendReply("213 " + numberTo<std::string>(item->content.size()));
            else
                sendReply("550 Could not get file size.");
        }
        else if (verb == "MDTM")
        {
            const std::optional<TestFile> item = server_.getFile(resolvePath(args));
            if (item && !item->isFolder)
                sendReply("213 " + formatMdtmTime(*item));
            else
                sendReply("550 Could not get file modification time.");
        }
        else if (verb == "MFMT")
        {
            const std::string timeStr = beforeFirst(args, ' ', IfNotFoundReturn::none);
            const std::string path = resolvePath(afterFirst(args, ' ', IfNotFoundReturn::none));

            const TimeComp tc = parseTime("%Y%m%d%H%M%S", beforeFirst(timeStr, '.', IfNotFoundReturn::all));
            const auto [modTime, timeValid] = utcToTimeT(tc);
            if (!timeValid)
                sendReply("501 Invalid time value.");
            else if (!server_.setModTime(path, modTime, stringTo<int>(afterFirst(timeStr, '.', IfNotFoundReturn::none))))
                sendReply("550 Could not set file modification time.");
            else
                sendReply("213 Modify=" + timeStr + "; " + getItemName(path));
        }
        else if ((verb == "PASV" || verb == "EPSV") && server_.cfg_.refusePassive)
            sendReply("502 Passive mode not allowed.");
        else if (verb == "PASV" || verb == "EPSV")
        {
            activeTarget_.reset();
            pasvListener_ = std::make_unique<ServerSocket>("127.0.0.1", 0); //throw SysError
            const uint16_t port = pasvListener_->getPort();

            if (verb == "PASV")
                sendReply("227 Entering Passive Mode (127,0,0,1," + numberTo<std::string>(port / 256) + ',' + numberTo<std::string>(port % 256) + ").");
            else
                sendReply("229 Entering Extended Passive Mode (|||" + numberTo<std::string>(port) + "|).");
        }
        else if (verb == "PORT" || verb == "EPRT")
        {
            pasvListener_.reset();
            activeTarget_ = verb == "PORT" ? parsePortArgs(args) : parseEprtArgs(args);
            if (activeTarget_)
                sendReply("200 " + verb + " command successful.");
            else
                sendReply("501 Illegal " + verb + " command.");
        }
        else if (verb == "LIST" || verb == "MLSD" || verb == "NLST" || verb == "RETR" || verb == "STOR")
            runTransfer(verb, args); //throw SysError, ThreadStopRequest
        else
            sendReply("502 Command not implemented.");

        return true;
    }


    void runTransfer(const std::string& verb, const std::string& args) //throw SysError, ThreadStopRequest
    {
        if (!pasvListener_ && !activeTarget_)
            return sendReply("425 Use PORT or PASV first.");

        std::unique_ptr<ServerSocket> pasvListener = std::move(pasvListener_);
        const std::optional<SocketAddress> activeTarget = std::exchange(activeTarget_, std::nullopt);

        const std::string path = resolvePath(args);
        std::string content;

        if (verb == "RETR")
        {
            const std::optional<TestFile> item = server_.getFile(path);
            if (!item || item->isFolder)
                return sendReply("550 Failed to open file.");
            content = item->content;
        }
        else if (verb != "STOR")
        {
            const std::optional<std::string> listing = getListing(verb, path);
            if (!listing)
                return sendReply("550 No such directory.");
            content = *listing;
        }

        sendReply("150 Opening " + std::string(protPrivate_ ? "protected " : "") + "data connection.");

        //client may drop the data connection at any time, e.g. certificate rejected or transfer aborted
        try
        {
            std::unique_ptr<Socket> dataSocket = pasvListener ?
                                                 pasvListener->accept(std::chrono::seconds(10)) : //throw SysError
                                                 std::make_unique<Socket>(activeTarget->ip, numberTo<std::string>(activeTarget->port), std::chrono::seconds(10)); //
            dataSocket->setIoTimeout(std::chrono::seconds(10)); //throw SysError
            ++server_.dataConnections_;

            std::unique_ptr<TlsStream> dataTls;
            if (protPrivate_)
            {
                dataTls = std::make_unique<TlsStream>(server_.dataTlsCtx_ ? *server_.dataTlsCtx_ : *server_.tlsCtx_, dataSocket->get(), "", nullptr); //throw SysError
                if (dataTls->isSessionReused())
                    ++server_.resumedDataSessions_;
            }

            if (verb == "STOR")
            {
                std::string received;
                char buffer[16 * 1024];
                for (;;)
                {
                    const size_t bytesRead = dataTls ?
                                             dataTls->tryRead(buffer, sizeof(buffer)) : //throw SysError
                                             tryReadSocket(dataSocket->get(), buffer, sizeof(buffer)); //
                    if (bytesRead == 0)
                        break;
                    received.append(buffer, bytesRead);
                    answerPendingNoops(); //throw SysError
                }
                server_.addFile(path, received, std::time(nullptr));
            }
            else
            {
                for (size_t pos = 0; pos < content.size();)
                {
                    const size_t blockSize = std::min(server_.cfg_.transferBlockSize, content.size() - pos);

                    for (size_t written = 0; written < blockSize;)
                        written += dataTls ?
                                   dataTls->tryWrite(content.data() + pos + written, blockSize - written) : //throw SysError
                                   tryWriteSocket(dataSocket->get(), content.data() + pos + written, blockSize - written); //
                    pos += blockSize;

                    if (server_.cfg_.transferBlockDelay > std::chrono::milliseconds(0))
                        interruptibleSleep(server_.cfg_.transferBlockDelay); //throw ThreadStopRequest
                    answerPendingNoops(); //throw SysError
                }
                if (dataTls)
                    dataTls->shutdown(); //throw SysError
                shutdownSocketSend(dataSocket->get()); //throw SysError
            }
        }
        catch (const SysError&)
        {
            return sendReply("426 Connection closed; transfer aborted.");
        }

        sendReply("226 Transfer complete.");
    }


    //servers either answer NOOPs during a transfer or queue them until it is done
    void answerPendingNoops() //throw SysError
    {
        if (!server_.cfg_.answerNoopDuringTransfer)
            return;

        while (tls_->hasPendingData() || waitForSocketReadable(socket_->get(), 0)) //throw SysError
        {
            if (!receiveData()) //throw SysError
                return;

            while (std::optional<std::string> line = extractLine())
                if (equalAsciiNoCase(*line, "NOOP"))
                {
                    ++server_.noops_;
                    sendReply("200 NOOP ok."); //throw SysError
                }
                else
                    queuedLines_.push_back(*line);
        }
    }


    std::optional<std::string> getListing(const std::string& verb, const std::string& path) const
    {
        std::string dirPath = path;
        if (dirPath != "/")
            if (const std::optional<TestFile> item = server_.getFile(dirPath);
                !item || !item->isFolder)
                return std::nullopt;

        std::string output;
        if (verb == "MLSD")
            output += "type=cdir;modify=20200101000000;unique=1; .\r\n";

        std::lock_guard dummy(server_.lockFiles_);
        for (const auto& [itemPath, item] : server_.files_)
            if (getParentPath(itemPath) == dirPath)
            {
                const std::string name = getItemName(itemPath);

                if (verb == "NLST")
                    output += itemPath + "\r\n";
                else if (verb == "MLSD")
                    output += (item.isFolder ? std::string("type=dir;") : "type=file;size=" + numberTo<std::string>(item.content.size()) + ';') +
                              "modify=" + formatMdtmTime(item) + ";unique=" + numberTo<std::string>(std::hash<std::string>()(itemPath) % 100000) + "; " + name + "\r\n";
                else
                    output += formatUnixListLine(name, item) + "\r\n";
            }
        return output;
    }


    std::string resolvePath(const std::string& arg) const
    {
        std::string path = arg.empty() ? cwd_ : startsWith(arg, '/') ? arg : (cwd_ == "/" ? "" : cwd_) + '/' + arg;
        if (path.size() > 1 && endsWith(path, '/'))
            path.pop_back();
        return path;
    }


    static std::optional<SocketAddress> parsePortArgs(const std::string& args)
    {
        const std::vector<std::string> numbers = splitCpy(args, ',', SplitOnEmpty::allow);
        if (numbers.size() != 6)
            return std::nullopt;

        SocketAddress addr;
        addr.ip = numbers[0] + '.' + numbers[1] + '.' + numbers[2] + '.' + numbers[3];
        addr.port = static_cast<uint16_t>(stringTo<int>(numbers[4]) * 256 + stringTo<int>(numbers[5]));
        addr.family = AF_INET;
        return addr;
    }


    static std::optional<SocketAddress> parseEprtArgs(const std::string& args) //"|1|127.0.0.1|6446|"
    {
        const std::vector<std::string> parts = splitCpy(args, '|', SplitOnEmpty::allow);
        if (parts.size() != 5)
            return std::nullopt;

        SocketAddress addr;
        addr.ip = parts[2];
        addr.port = static_cast<uint16_t>(stringTo<int>(parts[3]));
        addr.family = parts[1] == "2" ? AF_INET6 : AF_INET;
        return addr;
    }

    //------------------------------------------------------------------------------------

    std::optional<std::string> readLine() //throw SysError, ThreadStopRequest
    {
        if (!queuedLines_.empty())
        {
            std::string line = std::move(queuedLines_.front());
            queuedLines_.pop_front();
            return line;
        }

        for (;;)
        {
            if (std::optional<std::string> line = extractLine())
                return line;

            if (!(tls_ && tls_->hasPendingData()))
                while (!waitForSocketReadable(socket_->get(), 100)) //throw SysError
                    interruptionPoint(); //throw ThreadStopRequest

            if (!receiveData()) //throw SysError
                return std::nullopt;
        }
    }


    bool receiveData() //throw SysError; false on EOF
    {
        char buffer[4096];
        const size_t bytesRead = tls_ ?
                                 tls_->tryRead(buffer, sizeof(buffer)) : //throw SysError
                                 tryReadSocket(socket_->get(), buffer, sizeof(buffer)); //
        if (bytesRead == 0)
            return false;

        recvBuf_.append(buffer, bytesRead);
        return true;
    }


    std::optional<std::string> extractLine()
    {
        const size_t pos = recvBuf_.find('\n');
        if (pos == std::string::npos)
            return std::nullopt;

        std::string line = recvBuf_.substr(0, pos);
        recvBuf_.erase(0, pos + 1);
        if (endsWith(line, '\r'))
            line.pop_back();
        return line;
    }


    void sendReply(const std::string& reply) //throw SysError
    {
        const std::string buf = reply + "\r\n";
        for (size_t written = 0; written < buf.size();)
            written += tls_ ?
                       tls_->tryWrite(buf.data() + written, buf.size() - written) : //throw SysError
                       tryWriteSocket(socket_->get(), buf.data() + written, buf.size() - written); //
    }

    FtpsTestServer& server_;
    std::unique_ptr<Socket> socket_;
    std::unique_ptr<TlsStream> tls_;

    std::string recvBuf_;
    std::deque<std::string> queuedLines_; //received during a transfer

    std::string user_;
    bool loggedIn_ = false;
    bool protPrivate_ = false;
    std::string cwd_ = "/";

    std::unique_ptr<ServerSocket> pasvListener_;
    std::optional<SocketAddress> activeTarget_;
};


FtpsTestServer::FtpsTestServer(const TestServerConfig& cfg) : //throw SysError
    cfg_(cfg),
    listenSocket_("127.0.0.1", 0)
{
    const auto [certPem, keyPem] = createSelfSignedCertificate(cfg.subjectAltNames); //throw SysError
    certPem_ = certPem;

    tlsCtx_ = std::make_unique<TlsContext>(TlsRole::server); //throw SysError
    tlsCtx_->setCertificate(certPem, keyPem);                //
    if (cfg.maxTlsVersion)
        tlsCtx_->setMaxProtocolVersion(*cfg.maxTlsVersion); //throw SysError

    if (cfg.dataSubjectAltNames)
    {
        const auto [dataCertPem, dataKeyPem] = createSelfSignedCertificate(*cfg.dataSubjectAltNames); //throw SysError

        dataTlsCtx_ = std::make_unique<TlsContext>(TlsRole::server); //throw SysError
        dataTlsCtx_->setCertificate(dataCertPem, dataKeyPem);        //
        if (cfg.maxTlsVersion)
            dataTlsCtx_->setMaxProtocolVersion(*cfg.maxTlsVersion); //throw SysError
    }

    acceptThread_ = InterruptibleThread([this]
    {
        setCurrentThreadName("FTPS test server");
        acceptConnections(); //throw ThreadStopRequest
    });
}


FtpsTestServer::~FtpsTestServer()
{
    acceptThread_.requestStop();
    acceptThread_.join();

    std::lock_guard dummy(lockSessions_);
    for (InterruptibleThread& t : sessionThreads_)
        t.requestStop();
    for (InterruptibleThread& t : sessionThreads_)
        t.join();
}


void FtpsTestServer::acceptConnections() //throw ThreadStopRequest
{
    for (;;)
        try
        {
            while (!waitForSocketReadable(listenSocket_.get(), 100)) //throw SysError
                interruptionPoint(); //throw ThreadStopRequest

            std::unique_ptr<Socket> socket = listenSocket_.accept(std::chrono::seconds(1)); //throw SysError
            ++controlConnections_;

            std::lock_guard dummy(lockSessions_);
            sessionThreads_.emplace_back([this, socket = std::move(socket)]() mutable
            {
                setCurrentThreadName("FTPS test session");
                try
                {
                    Session session(*this, std::move(socket));
                    session.run(); //throw SysError, ThreadStopRequest
                }
                catch (const SysError&) {} //client is gone or misbehaved: end of session
            });
        }
        catch (const SysError& e)
        {
            logExtraError("FTPS test server: " + e.toString());
            interruptibleSleep(std::chrono::milliseconds(100)); //throw ThreadStopRequest
        }
}


void FtpsTestServer::addFolder(const std::string& path)
{
    std::lock_guard dummy(lockFiles_);
    files_[path] = TestFile{true};
}


void FtpsTestServer::addFile(const std::string& path, const std::string& content, time_t modTime, int modTimeMs)
{
    std::lock_guard dummy(lockFiles_);
    files_[path] = TestFile{false, content, modTime, modTimeMs};
}


std::optional<TestFile> FtpsTestServer::getFile(const std::string& path) const
{
    std::lock_guard dummy(lockFiles_);
    auto it = files_.find(path);
    if (it == files_.end())
        return std::nullopt;
    return it->second;
}


bool FtpsTestServer::setModTime(const std::string& path, time_t modTime, int modTimeMs)
{
    std::lock_guard dummy(lockFiles_);
    auto it = files_.find(path);
    if (it == files_.end() || it->second.isFolder)
        return false;

    it->second.modTime   = modTime;
    it->second.modTimeMs = modTimeMs;
    return true;
}
