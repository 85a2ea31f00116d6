// Generated equality example: address.edn is compiled by eqgenc into address_eq.hpp at build time.
#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>
#include "eqgen/runtime/hooks.hpp"

namespace app {

class Address {
public:
    Address(std::string city, std::string lastName, std::vector<std::string> tags, std::string note)
        : city(std::move(city)), lastName(std::move(lastName)), tags(std::move(tags)), note(std::move(note)) {}
    std::string describe() const { return lastName + ", " + city; }
private:
    std::string city;
    std::string lastName;
    std::vector<std::string> tags;
    std::string note;

    static bool Equals_LastName(const std::string& value, const std::string& other){
        if(value.size()!=other.size()) return false;
        for(size_t i=0;i<value.size(); ++i)
            if(std::tolower((unsigned char)value[i]) != std::tolower((unsigned char)other[i])) return false;
        return true;
    }
    static int GetHashCode_LastName(const std::string& value){
        unsigned h = 2166136261u;
        for(char c : value){ h ^= (unsigned char)std::tolower((unsigned char)c); h *= 16777619u; }
        return (int)h;
    }
    EQGEN_CONTRACT_HOOKS(Address);
};

class Email {
public:
    explicit Email(std::string v): Value(std::move(v)) {}
private:
    std::string Value;
    EQGEN_CONTRACT_HOOKS(Email);
};

class Color {
public:
    static const Color Red, Green, Blue;
    std::int64_t value() const { return Value; }
    const std::string& name() const { return Name; }
private:
    Color(std::int64_t v, std::string n): Value(v), Name(std::move(n)) {}
    std::int64_t Value;
    std::string Name;
    EQGEN_ENUMERATION_HOOKS(Color);
};

const Color Color::Red{1, "Red"};
const Color Color::Green{2, "Green"};
const Color Color::Blue{3, "Blue"};

} // namespace app

#include "address_eq.hpp"

int main(){
    app::Address a("Gaza", "Jaber", {"home", "billing"}, "first visit");
    app::Address b("Gaza", "JABER", {"billing", "home"}, "second visit");
    app::Address c("Rafah", "Jaber", {"home", "billing"}, "first visit");
    if(!(a==b) || std::hash<app::Address>{}(a)!=std::hash<app::Address>{}(b)){ std::cerr << "expected a == b\n"; return 1; }
    if(a==c){ std::cerr << "expected a != c\n"; return 1; }
    std::unordered_set<app::Address> seen{a, b, c};
    if(seen.size()!=2){ std::cerr << "expected 2 distinct addresses, got " << seen.size() << "\n"; return 1; }

    if(app::Email("x@example.org")!=app::Email("x@example.org")){ std::cerr << "expected equal emails\n"; return 1; }

    const app::Color& g = app::ColorEnumeration::from_name("Green");
    if(g.value()!=2 || app::ColorEnumeration::get_all().size()!=3 || app::ColorEnumeration::try_from_value(9)){
        std::cerr << "enumeration lookup mismatch\n"; return 1;
    }
    try { (void)app::ColorEnumeration::from_value(42); std::cerr << "expected lookup_error\n"; return 1; }
    catch(const eqgen::lookup_error& e){ std::cout << "lookup_error: " << e.what() << "\n"; }
    std::cout << "address example OK\n";
    return 0;
}
