#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class PlatformException : public std::runtime_error {
    public:
        explicit PlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class DataLoadException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // Input series is missing required fields or is malformed
    class InvalidDataException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class IndicatorCalculationException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class StrategyException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // Malformed strategy parameters (fast >= slow, oversold >= overbought, ...)
    class ParameterValidationException : public StrategyException {
    public: using StrategyException::StrategyException; };

    class BacktestException : public PlatformException {
    public: using PlatformException::PlatformException; };

} // namespace core
