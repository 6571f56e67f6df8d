#ifndef UUIDLIB_UUID_HPP
#define UUIDLIB_UUID_HPP
#include <cstdint>
#include <iostream>
#include <string>
#include <chrono>
namespace UUID{
    struct Node {
        const static std::size_t length = 6;
        unsigned char bytes[length];
    };
    std::ostream& operator<<(std::ostream& os, const Node& node);
    std::istream& operator>>(std::istream& is, Node& node);

    // UUID binary fields as defined in IETF RFC 9562:
    // https://datatracker.ietf.org/doc/html/rfc9562#section-5
    // This is 16 octets of data, stored in network byte order.
    // We set the default initialization of uuid structs to be all zeros (the Nil UUID).
    // Every constructor tagged with a version sets the version nibble (high nibble
    // of octet 6) and the variant bits (high two bits of octet 8, always 0b10).
    struct Uuid{
        constexpr static struct Version4{} v4{};
        constexpr static struct Version6{} v6{};
        constexpr static struct Version7{} v7{};
        constexpr static std::size_t size = 16; // UUID is always a 16 byte array.

        // v6 timestamps count 100ns intervals since 1582-10-15T00:00:00Z in 60 bits.
        // Earlier instants encode as 0, later ones as 2^60 - 1.
        using gregorian_duration = std::chrono::duration<std::int64_t, std::ratio<1, 10000000> >;
        using gregorian_time_point = std::chrono::time_point<std::chrono::system_clock, gregorian_duration>;
        using unix_ms_time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

        Uuid():bytes{}{}; // 0 initializing default constructor.
        Uuid(const Uuid& other); // copy constructor.
        Uuid& operator=(const Uuid& other);
        explicit Uuid(Uuid::Version4 v); // random.
        explicit Uuid(Uuid::Version6 v); // reordered gregorian time, random clock seq and node.
        explicit Uuid(Uuid::Version6 v, gregorian_time_point now);
        explicit Uuid(Uuid::Version7 v); // unix epoch milliseconds.
        explicit Uuid(Uuid::Version7 v, unix_ms_time_point timestamp);
        explicit Uuid(const std::string& uuid); // Construct Uuid from its canonical string.

        // Public Member bytes.
        unsigned char bytes[Uuid::size];

        unsigned int version() const;
        unsigned int variant() const;

        // v6 field layout.
        std::uint32_t time_high() const;
        std::uint16_t time_mid() const;
        std::uint16_t time_low() const;
        std::uint16_t clock_seq() const;
        Node node() const;
        std::uint64_t gregorian_ts() const;
        gregorian_time_point gregorian_time() const;

        // v7 field layout.
        std::uint64_t unix_ts_ms() const;

        std::string str() const;
    };
    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    std::istream& operator>>(std::istream& is, Uuid& uuid);
    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);

    // Fill a buffer from the kernel CSPRNG.
    // Throws std::system_error if getrandom fails.
    void fill_random(unsigned char* buf, std::size_t len);

    std::string generate_v4();
    std::string generate_v6();
    std::string generate_v6(Uuid::gregorian_time_point now);
    std::string generate_v7();
    std::string generate_v7_with_timestamp(Uuid::unix_ms_time_point timestamp);
}// uuid namespace
#endif
