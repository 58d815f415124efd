#include "client/remote_client.hpp"
#include "client/transfer_codec.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/protocol_io.hpp"
#include "common/socket.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

void Reply(TcpSocket& s, const proto::Writer& w) {
    s.write_frame(MsgType::MT_REPLY, 0, w.bytes().data(), w.size());
}

// Minimal framed build service. Serves 'connections' clients one after
// another; rmLog drops the connection without replying. With 'bad_listing'
// getFiles announces far more entries than the payload holds.
struct LoopbackServer {
    TcpSocket        listener;
    bool             bad_listing{false};
    std::atomic<int> logins{0};
    std::string      uploaded;
    std::thread      thread;

    explicit LoopbackServer(int connections, bool bad_listing = false)
        : bad_listing(bad_listing)
    {
        listener.bind_and_listen("127.0.0.1", 0);
        thread = std::thread([this, connections] { Serve(connections); });
    }

    ~LoopbackServer() {
        if (thread.joinable()) thread.join();
    }

    u16 port() const { return listener.local_port(); }

    void Serve(int connections) {
        TransferCodec codec;
        for (int i = 0; i < connections; ++i) {
            TcpSocket conn = listener.accept();
            FrameHeader hdr{};
            std::vector<u8> payload;
            while (conn.read_frame(hdr, payload)) {
                proto::Reader rd(payload);
                proto::Writer out;
                MsgType type = static_cast<MsgType>(hdr.msg_type);

                if (type == MsgType::MT_GET_VERSION) {
                    assert(rd.u32v() == PBREMOTE_MAGIC);
                    out.str(PBREMOTE_PROTOCOL_VERSION);
                    Reply(conn, out);
                } else if (type == MsgType::MT_LOGIN) {
                    std::string user = rd.str();
                    std::string pass = rd.str();
                    ++logins;
                    out.boolv(user == "root" && pass == "foo");
                    Reply(conn, out);
                } else if (type == MsgType::MT_CREATE_PROJECT) {
                    out.str("/var/cache/elbe/77");
                    Reply(conn, out);
                } else if (type == MsgType::MT_UPLOAD_FILE) {
                    assert(rd.str() == "/var/cache/elbe/77");
                    assert(rd.str() == PROJECT_CONFIG_NAME);
                    i32 part = rd.i32v();
                    std::vector<u8> data;
                    ChunkHdr ch = rd.chunk(data);
                    std::vector<u8> raw = codec.decode(EncodedChunk::from_wire(ch, std::move(data)));
                    uploaded.append(raw.begin(), raw.end());
                    out.i32v(part == UPLOAD_PART_FINAL ? UPLOAD_REPLY_COMPLETE : part + 1);
                    Reply(conn, out);
                } else if (type == MsgType::MT_BUILD_PBUILDER) {
                    assert(rd.str() == "/var/cache/elbe/77");
                    assert(rd.boolv() == true);
                    assert(rd.boolv() == false);
                    assert(rd.str() == "5G");
                    assert(rd.at_end());
                    Reply(conn, out);
                } else if (type == MsgType::MT_GET_FILES) {
                    rd.str();
                    if (bad_listing) {
                        out.u32v(0x40000000u).str("only.deb").str("one");
                        Reply(conn, out);
                        continue;
                    }
                    out.u32v(2);
                    out.str("pbuilder/foo.deb").str("Debian package");
                    out.str("log.txt").str("Log file");
                    Reply(conn, out);
                } else if (type == MsgType::MT_GET_FILE) {
                    rd.str();
                    assert(rd.str() == "log.txt");
                    u32 part = rd.u32v();
                    if (part == 0) {
                        const std::string text = "build log\n";
                        EncodedChunk c = codec.encode(text.data(), text.size());
                        out.boolv(false).chunk(c.header(), c.data.data());
                    } else {
                        out.boolv(true);
                    }
                    Reply(conn, out);
                } else if (type == MsgType::MT_GET_PROJECT_BUSY) {
                    const std::string msg = "project is locked";
                    conn.write_frame(MsgType::MT_ERROR_MSG, 0, msg.data(), (u32)msg.size());
                } else if (type == MsgType::MT_GET_PROJECT) {
                    // Out-of-sequence frame type.
                    conn.write_frame(MsgType::MT_GET_PROJECT, 0, nullptr, 0);
                } else if (type == MsgType::MT_RM_LOG) {
                    break;
                } else {
                    Reply(conn, out);
                }
            }
        }
        listener.close();
    }
};

void TestCallsOverLoopback() {
    LoopbackServer server(3);
    TcpRemoteService svc;
    svc.open("127.0.0.1", server.port(), 5);

    assert(svc.get_version() == PBREMOTE_PROTOCOL_VERSION);
    svc.login("root", "foo");
    std::string prj = svc.create_project();
    assert(prj == "/var/cache/elbe/77");

    // Acknowledged upload: data chunk at part 0, then the final marker.
    TransferCodec codec;
    const std::string xml = "<ns0:RootFileSystem/>";
    EncodedChunk first = codec.encode(xml.data(), xml.size());
    assert(svc.upload_file(prj, PROJECT_CONFIG_NAME, first, 0) == 1);
    EncodedChunk last = codec.encode(nullptr, 0);
    assert(svc.upload_file(prj, PROJECT_CONFIG_NAME, last, UPLOAD_PART_FINAL) ==
           UPLOAD_REPLY_COMPLETE);

    CcacheOptions cc;
    cc.enabled = false;
    cc.size    = "5G";
    svc.build_pbuilder(prj, true, cc);

    std::vector<RemoteFile> files = svc.get_files(prj);
    assert(files.size() == 2);
    assert(files[0].name == "pbuilder/foo.deb");
    assert(files[0].description == "Debian package");
    assert(files[1].name == "log.txt");

    FileChunkReply r0 = svc.get_file(prj, "log.txt", 0);
    assert(!r0.end_of_file);
    std::vector<u8> raw = codec.decode(r0.chunk);
    assert(std::string(raw.begin(), raw.end()) == "build log\n");
    assert(svc.get_file(prj, "log.txt", 1).end_of_file);

    // Error reply keeps the connection.
    bool threw = false;
    try {
        svc.get_project_busy(prj);
    } catch (const RemoteError& e) {
        threw = true;
        assert(std::string(e.what()).find("project is locked") != std::string::npos);
    }
    assert(threw);

    // Unexpected frame type drops the connection.
    threw = false;
    try {
        svc.get_project_status(prj);
    } catch (const ProtocolError&) {
        threw = true;
    }
    assert(threw);

    // Next call reconnects and replays the login; the server then drops it.
    threw = false;
    try {
        svc.rm_log(prj);
    } catch (const NetworkError&) {
        threw = true;
    }
    assert(threw);

    // And once more.
    svc.update_pbuilder(prj);
    assert(server.logins == 3);
    svc.close();

    server.thread.join();
    assert(server.uploaded == xml);
}

void TestLoginRejected() {
    LoopbackServer server(1);
    TcpRemoteService svc;
    svc.open("127.0.0.1", server.port(), 5);

    bool threw = false;
    try {
        svc.login("root", "wrong");
    } catch (const RemoteError&) {
        threw = true;
    }
    assert(threw);
    svc.close();
}

void TestOversizedFileListRejected() {
    LoopbackServer server(1, true);
    TcpRemoteService svc;
    svc.open("127.0.0.1", server.port(), 5);

    bool threw = false;
    try {
        svc.get_files("/var/cache/elbe/77");
    } catch (const ProtocolError& e) {
        threw = true;
        assert(std::string(e.what()).find("entries") != std::string::npos);
    }
    assert(threw);
    svc.close();
}

void TestConnectRefused() {
    u16 port;
    {
        TcpSocket probe;
        probe.bind_and_listen("127.0.0.1", 0);
        port = probe.local_port();
    }

    TcpRemoteService svc;
    bool threw = false;
    try {
        svc.open("127.0.0.1", port, 1);
    } catch (const NetworkError&) {
        threw = true;
    }
    assert(threw);
}

void TestCallWithoutOpen() {
    TcpRemoteService svc;
    bool threw = false;
    try {
        svc.get_version();
    } catch (const NetworkError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    platform::Guard platform_guard;
    Logger::get().set_level(LogLevel::ERR);

    TestCallsOverLoopback();
    TestLoginRejected();
    TestOversizedFileListRejected();
    TestConnectRefused();
    TestCallWithoutOpen();

    std::cout << "remote_client_test: pass\n";
    return 0;
}
