#include <mintgate/log/log.hpp>

#include <array>
#include <chrono>
#include <string>
#include <utility>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>

namespace mintgate::log {

void initialize() noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( mintgate::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(tags)%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

bool set_level( std::string_view level ) noexcept
{
  static constexpr std::array< std::pair< std::string_view, quill::LogLevel >, 6 > levels{
    { { "trace", quill::LogLevel::TraceL1 },
     { "debug", quill::LogLevel::Debug },
     { "info", quill::LogLevel::Info },
     { "warning", quill::LogLevel::Warning },
     { "error", quill::LogLevel::Error },
     { "critical", quill::LogLevel::Critical } }
  };

  for( const auto& [ name, value ]: levels )
  {
    if( name == level )
    {
      instance()->set_log_level( value );
      return true;
    }
  }

  return false;
}

} // namespace mintgate::log
