// reflect-based argument parser
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef ARGPARSER_H
#define ARGPARSER_H

#include <algorithm>
#include <optional>
#include <reflect>
#include <set>
#include <spanstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace argparser {

// Usable as a template argument, hence the fixed-size strings
struct Opts {
  char shortName = 0;
  bool required = false;
  char metavar[16] = "VALUE";
  char help[128] = "";
};

template <class T, Opts opts = {}> struct Option : public T {
  using T::T;
  static constexpr Opts argparser_options = opts;

  operator T() noexcept { return *this; }

  operator const T() const noexcept { return *this; }
};

template <std::integral T, Opts opts> struct Option<T, opts> {
  static constexpr Opts argparser_options = opts;

  constexpr Option() = default;
  Option(T data) : m_data{data} {}

  operator T() noexcept { return m_data; }

  operator const T() const noexcept { return m_data; }

private:
  T m_data{};
};

class PositionalArguments : public std::vector<std::string> {
public:
  using vector::vector;

  void setCatchAll(bool on) { m_catchAll = on; }

  bool isCatchAll() const { return m_catchAll; }

private:
  bool m_catchAll = false;
};

namespace detail {
template <typename T> struct Unwrapper {
  using type = T;
  static constexpr Opts opts = {};
};
template <typename T, Opts o> struct Unwrapper<Option<T, o>> {
  using type = T;
  static constexpr Opts opts = o;
};

template <typename T> constexpr Opts GetOpts = Unwrapper<T>::opts;

template <typename T> using UnwrapOption = Unwrapper<T>::type;

template <typename T>
constexpr bool isVector =
    requires { []<typename U>(const std::vector<U> &) {}(T{}); };

template <typename T>
constexpr bool isOptional =
    requires { []<typename U>(const std::optional<U> &) {}(T{}); };

template <typename ArgClass, typename T> struct ArgInfo {
  using value_type = T;

  std::string name;
  T *ptr{};
};

template <typename T>
constexpr bool isPositionalArguments =
    std::is_same_v<std::remove_cvref_t<T>, PositionalArguments>;

template <typename ArgClass> constexpr bool hasPositionalArguments() {
  return [&]<auto... Ns>(std::index_sequence<Ns...>) {
    return (... || isPositionalArguments<decltype(reflect::get<Ns>(
                       std::declval<ArgClass>()))>);
  }(std::make_index_sequence<reflect::size<ArgClass>()>());
}

template <typename ArgClass>
PositionalArguments *getPositionalArguments(ArgClass &args) {
  PositionalArguments *ret{};

  auto check = [&]<typename T>(T &member) {
    if constexpr (std::is_same_v<T, PositionalArguments>) {
      ret = &member;
      return true;
    } else
      return false;
  };

  [&]<auto... Ns>(std::index_sequence<Ns...>) {
    (... || check(reflect::get<Ns>(args)));
  }(std::make_index_sequence<reflect::size<ArgClass>()>());

  return ret;
}

template <int N, typename T, typename ArgClass> auto argInfo(ArgClass &args) {
  if (isPositionalArguments<decltype(reflect::get<N>(args))>)
    return ArgInfo<ArgClass, T>{};

  return ArgInfo<ArgClass, T>{std::string{reflect::member_name<N, ArgClass>()},
                              &reflect::get<N>(args)};
}

inline std::string optionName(std::string_view memberName) {
  std::string name{memberName};
  std::ranges::replace(name, '_', '-');
  return name;
}

template <class ArgClass, int N>
void describeMember(std::string &out) {
  using MemberType =
      std::remove_cvref_t<decltype(reflect::get<N>(std::declval<ArgClass &>()))>;

  if constexpr (isPositionalArguments<MemberType>)
    return;
  else {
    using ValueType = UnwrapOption<MemberType>;
    constexpr Opts opts = GetOpts<MemberType>;

    std::string flag = opts.shortName ? fmt::format("-{}, ", opts.shortName)
                                      : std::string(4, ' ');
    flag += "--" + optionName(reflect::member_name<N, ArgClass>());
    if constexpr (!std::is_same_v<ValueType, bool>)
      flag += fmt::format(" {}", opts.metavar);

    std::string help = opts.help;
    if constexpr (isVector<ValueType>)
      help += help.empty() ? "(repeatable)" : " (repeatable)";
    if (opts.required)
      help += help.empty() ? "(required)" : " (required)";

    out += fmt::format("  {:<28} {}\n", flag, help);
  }
}
} // namespace detail

class ArgumentException : public std::runtime_error {
public:
  ArgumentException(const std::string &msg) : std::runtime_error{msg} {}
};

template <typename T>
concept argument_list =
    std::ranges::random_access_range<T> &&
    std::is_convertible_v<std::ranges::range_value_t<T>, std::string_view>;

template <typename ArgClass> class Parser {
public:
  explicit Parser(ArgClass &args) : m_args{args} {}

  template <argument_list ArgumentList>
  void parse(const ArgumentList &arguments) {
    using namespace std::literals;

    auto ARG_INFOS = [&]<auto... Ns>(std::index_sequence<Ns...>) {
      return std::make_tuple(
          detail::argInfo<
              Ns, std::remove_cvref_t<decltype(reflect::get<Ns>(m_args))>>(
              m_args)...);
    }(std::make_index_sequence<reflect::size<ArgClass>()>());

    constexpr bool ACCEPTS_POSITIONAL =
        detail::hasPositionalArguments<ArgClass>();
    PositionalArguments *positional = detail::getPositionalArguments(m_args);

    for (std::size_t i = 0; i < std::size(arguments); ++i) {
      auto arg = std::string_view{arguments[i]};

      if constexpr (ACCEPTS_POSITIONAL) {
        if (positional->isCatchAll()) {
          positional->push_back(std::string{arg});
          continue;
        }
      }

      if (!arg.starts_with("-"sv) || arg == "-"sv) {
        if constexpr (ACCEPTS_POSITIONAL) {
          // The first positional argument ends option parsing, the rest
          // belongs to the command.
          positional->setCatchAll(true);
          for (std::size_t j = i; j < std::size(arguments); ++j)
            positional->push_back(std::string{arguments[j]});

          return;
        } else
          throw ArgumentException{fmt::format("Invalid argument '{}'", arg)};
      }

      if (arg == "--"sv) {
        if constexpr (ACCEPTS_POSITIONAL) {
          positional->setCatchAll(true);
          for (std::size_t j = i + 1; j < std::size(arguments); ++j)
            positional->push_back(std::string{arguments[j]});
          return;
        } else {
          if (i + 1 != std::size(arguments))
            throw ArgumentException{fmt::format(
                "Unexpected argument '{}'", std::string_view{arguments[i + 1]})};
          return;
        }
      }

      std::string_view argName =
          arg.starts_with("--"sv) ? arg.substr(2) : arg.substr(1);

      // Decompose argName into key and value (for --X=Y options)
      std::string key;
      std::optional<std::string_view> value;

      auto equalsSign = argName.find('=');
      if (equalsSign != std::string_view::npos) {
        key = argName.substr(0, equalsSign);
        value = argName.substr(equalsSign + 1);
      } else
        key = argName;

      if (!arg.starts_with("--"sv) && key.length() != 1)
        throw ArgumentException{fmt::format("Invalid short option '-{}'", key)};

      std::ranges::replace(key, '-', '_');

      auto parseValue = [&]<typename T>(T &target) {
        // If we don't have a value already (from --X=Y), grab the next
        // argument.
        if (!value) {
          if (i + 1 == std::size(arguments))
            throw ArgumentException{
                fmt::format("'{}' requires an argument", arg)};

          value = arguments[i + 1];
          ++i;
        }

        if constexpr (std::is_same_v<T, std::string>)
          target = std::string{*value};
        else {
          std::ispanstream is{*value};
          is >> target;

          if (!is)
            throw ArgumentException{fmt::format(
                "Could not parse argument '{}' to --{}", *value,
                detail::optionName(key))};
        }
      };

      auto tryParam = [&]<typename T>(T &argInfo) -> bool {
        using ValueType = detail::UnwrapOption<typename T::value_type>;
        constexpr Opts opts = detail::GetOpts<typename T::value_type>;

        if (!argInfo.ptr)
          return false;

        if (key != argInfo.name &&
            !(key.size() == 1 && key[0] == opts.shortName))
          return false;

        if constexpr (detail::isVector<ValueType>) {
          parseValue(argInfo.ptr->emplace_back());
        } else if constexpr (detail::isOptional<ValueType>) {
          parseValue(argInfo.ptr->emplace());
        } else if constexpr (std::is_same_v<ValueType, bool>) {
          if (value)
            throw ArgumentException{fmt::format(
                "--{} does not take a value", detail::optionName(key))};
          *argInfo.ptr = true;
        } else {
          parseValue((ValueType &)*argInfo.ptr);
        }

        m_seen.insert(argInfo.name);
        return true;
      };

      bool found = std::apply(
          [&](auto &...infos) { return (... || tryParam(infos)); }, ARG_INFOS);
      if (!found)
        throw ArgumentException{
            fmt::format("Unknown argument --{}", detail::optionName(key))};
    }
  }

  // Throws ArgumentException naming the first missing required option.
  void checkRequired() const {
    auto check = [&]<int N>() {
      using MemberType = std::remove_cvref_t<decltype(reflect::get<N>(m_args))>;
      if constexpr (!detail::isPositionalArguments<MemberType>) {
        constexpr Opts opts = detail::GetOpts<MemberType>;
        std::string name{reflect::member_name<N, ArgClass>()};
        if (opts.required && !m_seen.contains(name))
          throw ArgumentException{fmt::format(
              "Missing required option --{}", detail::optionName(name))};
      }
    };

    [&]<auto... Ns>(std::index_sequence<Ns...>) {
      (..., check.template operator()<Ns>());
    }(std::make_index_sequence<reflect::size<ArgClass>()>());
  }

private:
  ArgClass &m_args;
  std::set<std::string> m_seen;
};

template <typename ArgClass, argument_list Container>
void parse(ArgClass &args, const Container &arguments) {
  Parser parser{args};
  parser.parse(arguments);
  parser.checkRequired();
}

// One line per option, generated from the members of ArgClass
template <class ArgClass> std::string describe() {
  std::string out;

  [&]<auto... Ns>(std::index_sequence<Ns...>) {
    (..., detail::describeMember<ArgClass, Ns>(out));
  }(std::make_index_sequence<reflect::size<ArgClass>()>());

  return out;
}

} // namespace argparser

#endif
