#include <zpr/zpr.hpp>

int main() {
    echo::info("ZPR protocol definitions v", zpr::get_version_string().c_str(), " loaded successfully!");
    echo::info("Packet info header: ", zpr::get_packet_info_version_name(zpr::PACKET_INFO_VERSION_CURRENT));
    echo::info("Available types:");
    echo::info("  Identifiers: Address, DistinguishedName");
    echo::info("  Packet metadata: PacketInfo, RpcCommand, Frame");
    echo::info("  Serialization: Sink, BufferSink, FdSink, Reader");
    echo::info("");
    echo::info("RPC commands:");
    for (const auto &info : zpr::KNOWN_COMMANDS) {
        echo::info("  ", static_cast<dp::u32>(info.command), " ", info.name);
    }
    echo::info("");
    echo::info("Visa service: ", zpr::visa_service_endpoint().to_string().c_str(), " (",
               zpr::visa_service_dn().to_canonical_string().c_str(), ")");
    echo::info("See examples/packet_frame.cpp and dn_tool.cpp for usage");
    return 0;
}
