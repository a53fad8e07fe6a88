#include <zpr/zpr.hpp>

#include <unistd.h>

int main() {
    echo::info("Packet frame example starting...");

    auto src_addr = zpr::Address::from_string("[fd5a:5052::10]:5001");
    auto src_dn = zpr::DistinguishedName::parse("O=Acme,OU=Edge,CN=adapter-1");
    if (src_addr.is_err() || src_dn.is_err()) {
        echo::error("Failed to build source principal");
        return 1;
    }

    // Talk to the visa service
    zpr::PacketEndpoint source{src_addr.value(), src_dn.value()};
    zpr::PacketEndpoint destination{zpr::visa_service_endpoint(), zpr::visa_service_dn()};

    zpr::PacketAux aux;
    aux.seq = 1;
    aux.link = zpr::DOCK_LINK_ID;

    dp::String text("hello from adapter-1");
    zpr::Bytes payload(text.begin(), text.end());

    auto info = zpr::PacketInfo::build(source, destination, zpr::Command::Echo, aux)
                    .with_length(static_cast<dp::u32>(payload.size()));

    // Encode into memory
    zpr::Bytes wire;
    zpr::BufferSink buffer(wire);
    auto written = zpr::write_frame(info, payload, buffer);
    if (written.is_err()) {
        echo::error("Failed to write frame: ", written.error().to_string().c_str());
        return 1;
    }
    echo::info("Encoded frame: ", written.value(), " bytes");

    // Dump the hex to stdout through a descriptor sink
    dp::String hex = zpr::to_hex(wire) + "\n";
    zpr::FdSink out(STDOUT_FILENO);
    auto dump = zpr::write_bytes(out, reinterpret_cast<const dp::u8 *>(hex.c_str()), hex.size());
    if (dump.is_err()) {
        echo::error("Failed to write to stdout: ", dump.error().to_string().c_str());
        return 1;
    }

    // Decode it back
    auto frame = zpr::read_frame(wire);
    if (frame.is_err()) {
        echo::error("Failed to read frame: ", frame.error().to_string().c_str());
        return 1;
    }

    auto decoded = frame.value().info;
    echo::info("Decoded command: ", decoded.command().to_string().c_str());
    echo::info("  from ", decoded.source().address.to_string().c_str(), " ",
               decoded.source().dn.to_canonical_string().c_str());
    echo::info("  to   ", decoded.destination().address.to_string().c_str(), " ",
               decoded.destination().dn.to_canonical_string().c_str());
    echo::info("  seq=", decoded.aux().seq, " link=", decoded.aux().link, " payload=", frame.value().payload.size());

    // A frame whose declared length is wrong is refused before anything is written
    zpr::Bytes rejected;
    zpr::BufferSink rejected_sink(rejected);
    auto bad = zpr::write_frame(info.with_length(10), payload, rejected_sink);
    if (bad.is_err()) {
        echo::info("Mismatched frame refused: ", bad.error().to_string().c_str());
    }

    echo::info("Packet frame example done");
    return 0;
}
