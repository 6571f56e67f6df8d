#include "uuid.hpp"
#include <cstring>
#include <cerrno>
#include <iomanip>
#include <sstream>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <sys/random.h>

/*bit masks for UUID Versions, applied to the high nibble of octet 6.*/
#define UUID_VERSION_4 0x40
#define UUID_VERSION_6 0x60
#define UUID_VERSION_7 0x70
#define UUID_VERSION_MASK 0x0F

/*RFC variant, applied to the high two bits of octet 8.*/
#define UUID_VARIANT_RFC 0x80
#define UUID_VARIANT_MASK 0x3F

namespace UUID{
    // 100ns intervals between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z.
    constexpr static std::int64_t GREGORIAN_OFFSET = 122192928000000000LL;
    constexpr static std::int64_t GREGORIAN_MAX = (std::int64_t{1} << 60) - 1;
    constexpr static std::int64_t UNIX_MS_MAX = (std::int64_t{1} << 48) - 1;
    constexpr static std::size_t CANONICAL_LENGTH = 36;
    constexpr static std::size_t NODE_OFFSET = CANONICAL_LENGTH - Node::length*2;

    template<class T>
    static T saturate_cast(std::uint64_t value){
        if(value > std::numeric_limits<T>::max()){
            return std::numeric_limits<T>::max();
        }
        return static_cast<T>(value);
    }

    static bool is_hyphen_position(std::size_t pos){
        return (pos == 8 || pos == 13 || pos == 18 || pos == 23);
    }

    static void set_version_and_variant(unsigned char* bytes, unsigned char version){
        bytes[6] = (bytes[6] & UUID_VERSION_MASK) | version;
        bytes[8] = (bytes[8] & UUID_VARIANT_MASK) | UUID_VARIANT_RFC;
    }

    // Clamps into [0, 2^60) instead of wrapping.
    static std::uint64_t gregorian_intervals(Uuid::gregorian_time_point now){
        std::int64_t unix_intervals = now.time_since_epoch().count();
        if(unix_intervals < -GREGORIAN_OFFSET){
            return 0;
        }
        if(unix_intervals > std::numeric_limits<std::int64_t>::max() - GREGORIAN_OFFSET){
            return GREGORIAN_MAX;
        }
        std::int64_t intervals = unix_intervals + GREGORIAN_OFFSET;
        if(intervals > GREGORIAN_MAX){
            return GREGORIAN_MAX;
        }
        return static_cast<std::uint64_t>(intervals);
    }

    void fill_random(unsigned char* buf, std::size_t len){
        std::size_t filled = 0;
        while(filled < len){
            ssize_t n = getrandom(buf + filled, len - filled, 0);
            if(n == -1){
                if(errno == EINTR){
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "getrandom");
            }
            filled += static_cast<std::size_t>(n);
        }
    }

    /*UUID.Node POD*/
    std::ostream& operator<<(std::ostream& os, const Node& node) {
        std::ios::fmtflags os_flags(os.flags());
        char fill = os.fill('0');
        for(std::size_t i=0; i < Node::length; ++i){
            os << std::setw(2) << std::hex << static_cast<unsigned int>(node.bytes[i]);
        }
        os.fill(fill);
        os.flags(os_flags);
        return os;
    }

    std::istream& operator>>(std::istream& is, Node& node){
        char hex_str[Node::length*2] = {};
        is.read(hex_str, sizeof(hex_str));
        if(is.gcount() != static_cast<std::streamsize>(sizeof(hex_str))){
            is.setstate(std::ios::failbit);
            return is;
        }
        Node tmp = {};
        for(std::size_t i=0; i < Node::length; ++i){
            const char* first = &hex_str[i*2];
            std::from_chars_result res = std::from_chars(first, first+2, tmp.bytes[i], 16);
            if(res.ec != std::errc{} || res.ptr != first+2){
                is.setstate(std::ios::failbit);
                return is;
            }
        }
        node = tmp;
        return is;
    }

    /*UUID*/
    Uuid::Uuid(const Uuid& other)
    {
        std::memcpy(bytes, other.bytes, Uuid::size);
    }

    Uuid& Uuid::operator=(const Uuid& other)
    {
        std::memcpy(bytes, other.bytes, Uuid::size);
        return *this;
    }

    Uuid::Uuid(Uuid::Version4)
      : bytes{}
    {
        fill_random(bytes, Uuid::size);
        set_version_and_variant(bytes, UUID_VERSION_4);
    }

    Uuid::Uuid(Uuid::Version6 v)
      : Uuid(v, std::chrono::floor<Uuid::gregorian_duration>(std::chrono::system_clock::now()))
    {}

    Uuid::Uuid(Uuid::Version6, Uuid::gregorian_time_point now)
      : bytes{}
    {
        std::uint64_t timestamp = gregorian_intervals(now);
        std::uint32_t time_high = saturate_cast<std::uint32_t>(timestamp >> 28);
        std::uint16_t time_mid = saturate_cast<std::uint16_t>((timestamp >> 12) & 0xFFFF);
        std::uint16_t time_low = saturate_cast<std::uint16_t>(timestamp & 0x0FFF);

        bytes[0] = static_cast<unsigned char>(time_high >> 24);
        bytes[1] = static_cast<unsigned char>(time_high >> 16);
        bytes[2] = static_cast<unsigned char>(time_high >> 8);
        bytes[3] = static_cast<unsigned char>(time_high);
        bytes[4] = static_cast<unsigned char>(time_mid >> 8);
        bytes[5] = static_cast<unsigned char>(time_mid);
        bytes[6] = static_cast<unsigned char>(time_low >> 8);
        bytes[7] = static_cast<unsigned char>(time_low);

        // Clock sequence and node are random. No hardware address is used.
        fill_random(&bytes[8], Uuid::size - 8);
        set_version_and_variant(bytes, UUID_VERSION_6);
    }

    Uuid::Uuid(Uuid::Version7 v)
      : Uuid(v, std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()))
    {}

    Uuid::Uuid(Uuid::Version7, Uuid::unix_ms_time_point timestamp)
      : bytes{}
    {
        std::int64_t ms = timestamp.time_since_epoch().count();
        if(ms < 0){
            ms = 0;
        } else if(ms > UNIX_MS_MAX){
            ms = UNIX_MS_MAX;
        }
        std::uint64_t unix_ts_ms = static_cast<std::uint64_t>(ms);
        for(std::size_t i=0; i < 6; ++i){
            bytes[i] = static_cast<unsigned char>(unix_ts_ms >> (40 - 8*i));
        }
        fill_random(&bytes[6], Uuid::size - 6);
        set_version_and_variant(bytes, UUID_VERSION_7);
    }

    Uuid::Uuid(const std::string& uuid)
      : bytes{}
    {
        Uuid tmp;
        std::istringstream ss(uuid);
        ss >> tmp;
        if(ss.fail() || ss.peek() != std::char_traits<char>::eof()){
            throw std::invalid_argument("malformed uuid: '" + uuid + "'");
        }
        std::memcpy(bytes, tmp.bytes, Uuid::size);
    }

    unsigned int Uuid::version() const {
        return bytes[6] >> 4;
    }

    unsigned int Uuid::variant() const {
        return bytes[8] >> 6;
    }

    std::uint32_t Uuid::time_high() const {
        return (static_cast<std::uint32_t>(bytes[0]) << 24)
            | (static_cast<std::uint32_t>(bytes[1]) << 16)
            | (static_cast<std::uint32_t>(bytes[2]) << 8)
            | static_cast<std::uint32_t>(bytes[3]);
    }
    std::uint16_t Uuid::time_mid() const {
        return static_cast<std::uint16_t>((bytes[4] << 8) | bytes[5]);
    }
    std::uint16_t Uuid::time_low() const {
        return static_cast<std::uint16_t>(((bytes[6] & UUID_VERSION_MASK) << 8) | bytes[7]);
    }
    std::uint16_t Uuid::clock_seq() const {
        return static_cast<std::uint16_t>(((bytes[8] & UUID_VARIANT_MASK) << 8) | bytes[9]);
    }
    Node Uuid::node() const {
        Node tmp = {};
        std::memcpy(tmp.bytes, &bytes[10], Node::length);
        return tmp;
    }

    std::uint64_t Uuid::gregorian_ts() const {
        return (static_cast<std::uint64_t>(time_high()) << 28)
            | (static_cast<std::uint64_t>(time_mid()) << 12)
            | static_cast<std::uint64_t>(time_low());
    }

    Uuid::gregorian_time_point Uuid::gregorian_time() const {
        std::int64_t intervals = static_cast<std::int64_t>(gregorian_ts()) - GREGORIAN_OFFSET;
        return gregorian_time_point{gregorian_duration{intervals}};
    }

    std::uint64_t Uuid::unix_ts_ms() const {
        std::uint64_t ms = 0;
        for(std::size_t i=0; i < 6; ++i){
            ms = (ms << 8) | bytes[i];
        }
        return ms;
    }

    std::string Uuid::str() const {
        std::ostringstream ss;
        ss << *this;
        return ss.str();
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        std::ios::fmtflags os_flags(os.flags());
        char fill = os.fill('0');
        os << std::hex << std::nouppercase;
        for(std::size_t i=0; i < Uuid::size; ++i){
            if(i == 4 || i == 6 || i == 8 || i == 10){
                os << '-';
            }
            os << std::setw(2) << static_cast<unsigned int>(uuid.bytes[i]);
        }
        os.fill(fill);
        os.flags(os_flags);
        return os;
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        // Everything up to and including the last hyphen, the node follows.
        char uuid_str[NODE_OFFSET] = {};
        is.read(uuid_str, NODE_OFFSET);
        if(is.gcount() != static_cast<std::streamsize>(NODE_OFFSET)){
            is.setstate(std::ios::failbit);
            return is;
        }

        Uuid tmp;
        std::size_t octet = 0;
        std::size_t pos = 0;
        while(pos < NODE_OFFSET){
            if(is_hyphen_position(pos)){
                if(uuid_str[pos] != '-'){
                    is.setstate(std::ios::failbit);
                    return is;
                }
                ++pos;
                continue;
            }
            const char* first = &uuid_str[pos];
            std::from_chars_result res = std::from_chars(first, first+2, tmp.bytes[octet], 16);
            if(res.ec != std::errc{} || res.ptr != first+2){
                is.setstate(std::ios::failbit);
                return is;
            }
            ++octet;
            pos += 2;
        }

        Node node = {};
        if(!(is >> node)){
            return is;
        }
        std::memcpy(&tmp.bytes[octet], node.bytes, Node::length);
        uuid = tmp;
        return is;
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        for(std::size_t i=0; i < Uuid::size; ++i){
            if(lhs.bytes[i] != rhs.bytes[i]){
                return false;
            }
        }
        return true;
    }

    bool operator!=(const Uuid&lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    std::string generate_v4(){
        return Uuid(Uuid::v4).str();
    }

    std::string generate_v6(){
        return Uuid(Uuid::v6).str();
    }

    std::string generate_v6(Uuid::gregorian_time_point now){
        return Uuid(Uuid::v6, now).str();
    }

    std::string generate_v7(){
        return Uuid(Uuid::v7).str();
    }

    std::string generate_v7_with_timestamp(Uuid::unix_ms_time_point timestamp){
        return Uuid(Uuid::v7, timestamp).str();
    }
}
