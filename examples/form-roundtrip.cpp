#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <urlform/timestring.hpp>
#include <urlform/urlform.hpp>

using namespace urlform;

namespace {

struct Pet {
  std::string name;
  int age{};
};

struct Registration {
  std::string name;
  int age{};
  bool isActive{};
  std::optional<std::vector<std::string>> tags;
  std::optional<std::vector<Pet>> pets;
  SysTimePoint registeredAt;
};

}  // namespace

template <>
struct urlform::FormCodable<Pet> {
  static void encode(const Pet& pet, KeyedEncodingContainer& container) {
    container.encode("name", pet.name);
    container.encode("age", pet.age);
  }

  static Pet decode(KeyedDecodingContainer& container) {
    return {container.decode<std::string>("name"), container.decode<int>("age")};
  }
};

template <>
struct urlform::FormCodable<Registration> {
  static void encode(const Registration& registration, KeyedEncodingContainer& container) {
    container.encode("name", registration.name);
    container.encode("age", registration.age);
    container.encode("isActive", registration.isActive);
    container.encode("tags", registration.tags);
    container.encode("pets", registration.pets);
    container.encode("registeredAt", registration.registeredAt);
  }

  static Registration decode(KeyedDecodingContainer& container) {
    Registration registration;
    registration.name = container.decode<std::string>("name");
    registration.age = container.decode<int>("age");
    registration.isActive = container.decode<bool>("isActive");
    registration.tags = container.decodeIfPresent<std::vector<std::string>>("tags");
    registration.pets = container.decodeIfPresent<std::vector<Pet>>("pets");
    registration.registeredAt = container.decode<SysTimePoint>("registeredAt");
    return registration;
  }
};

namespace {

void Print(const Registration& registration) {
  std::cout << "  name: " << registration.name << "\n  age: " << registration.age
            << "\n  isActive: " << std::boolalpha << registration.isActive << '\n';
  if (registration.tags) {
    std::cout << "  tags:";
    for (const auto& tag : *registration.tags) {
      std::cout << ' ' << tag;
    }
    std::cout << '\n';
  }
  if (registration.pets) {
    for (const auto& pet : *registration.pets) {
      std::cout << "  pet: " << pet.name << " (" << pet.age << ")\n";
    }
  }
  std::cout << "  registeredAt: " << TimeToStringISO8601UTCWithMs(registration.registeredAt) << '\n';
}

}  // namespace

// Usage: urlform-form-roundtrip [accumulate|brackets|indices] [body]
// Without body, encodes a sample record with the given array strategy and decodes it back.
// With a body, decodes it with an auto detected array strategy (dates in ISO 8601).
int main(int argc, char** argv) {
  const std::string_view strategyName = argc > 1 ? argv[1] : "indices";

  ArrayEncodingStrategy arrayStrategy = ArrayEncodingStrategy::bracketsWithIndices();
  if (strategyName == "accumulate") {
    arrayStrategy = ArrayEncodingStrategy::accumulateValues();
  } else if (strategyName == "brackets") {
    arrayStrategy = ArrayEncodingStrategy::brackets();
  } else if (strategyName != "indices") {
    std::cerr << "Unknown array strategy: " << strategyName << "\n";
    return EXIT_FAILURE;
  }

  try {
    if (argc > 2) {
      const auto registration =
          FormDecoder::decodeWithAutoDetection<Registration>(argv[2], DateDecodingStrategy::iso8601());
      std::cout << "Decoded:\n";
      Print(registration);
      return EXIT_SUCCESS;
    }

    Registration registration{"John Doe", 30, true, std::vector<std::string>{"forms", "c++"}, std::nullopt,
                              SysClock::now()};
    if (arrayStrategy.type() == ArrayEncodingStrategy::Type::BracketsWithIndices) {
      // sequences of multi field records need indices in keys
      registration.pets = std::vector<Pet>{{"Rex", 3}};
    }

    FormEncoder encoder(FormEncoderConfig{}
                            .withArrayStrategy(arrayStrategy)
                            .withDateStrategy(DateEncodingStrategy::iso8601()));
    const std::string body = encoder.encode(registration);
    std::cout << "Encoded with " << arrayStrategy.name() << ":\n  " << body << '\n';

    const FormDecoder decoder(FormDecoderConfig::WithAutoDetectedStrategy(body, DateDecodingStrategy::iso8601()));
    std::cout << "Decoded with " << decoder.config().arrayStrategy.name() << ":\n";
    Print(decoder.decode<Registration>(body));
  } catch (const FormError& ex) {
    std::cerr << "Form error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
