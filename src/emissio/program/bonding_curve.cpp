#include <emissio/program/bonding_curve.hpp>

#include <algorithm>
#include <optional>
#include <vector>

#include <emissio/curve/lifecycle.hpp>
#include <emissio/encode.hpp>
#include <emissio/log.hpp>
#include <emissio/program/instruction.hpp>

namespace emissio::program {

namespace {

protocol::account to_account( protocol::account_view view ) noexcept
{
  protocol::account a{};
  std::ranges::copy( view, a.begin() );
  return a;
}

class stdin_source
{
public:
  explicit stdin_source( system_interface* system ) noexcept:
      _system( system )
  {}

  std::error_code read( std::span< std::byte > buffer )
  {
    return _system->read( file_descriptor::stdin, buffer );
  }

private:
  system_interface* _system;
};

template< typename T >
result< std::optional< T > > load( system_interface* system, std::uint32_t id )
{
  auto object = system->get_object( id, std::span< const std::byte >{} );
  if( object.empty() )
    return std::optional< T >{};

  auto value = encode::from_archive< T >( object );
  if( !value )
    return std::unexpected( program_errc::unexpected_object );

  return std::optional< T >( std::move( *value ) );
}

template< typename T >
std::error_code store( system_interface* system, std::uint32_t id, const T& value )
{
  return system->put_object( id, std::span< const std::byte >{}, encode::to_archive( value ) );
}

class object_holder_book final: public curve::holder_book
{
public:
  explicit object_holder_book( system_interface* system ) noexcept:
      _system( system )
  {}

  curve::result< math::uint128 > balance_of( const protocol::account& holder ) override
  {
    auto object = _system->get_object( bonding_curve::balance_id, holder );
    if( object.empty() )
      return math::uint128( 0 );

    if( object.size() != encode::uint128_size )
      return std::unexpected( program_errc::unexpected_object );

    return encode::from_little_endian( object.first< encode::uint128_size >() );
  }

  std::error_code set_balance( const protocol::account& holder, const math::uint128& balance ) override
  {
    if( balance == 0 )
      return _system->remove_object( bonding_curve::balance_id, holder );

    return _system->put_object( bonding_curve::balance_id, holder, encode::to_little_endian( balance ) );
  }

  curve::result< std::vector< curve::holding > > holdings() override
  {
    std::vector< curve::holding > result;
    std::vector< std::byte > cursor;

    for( ;; )
    {
      auto [ key, value ] = _system->get_next_object( bonding_curve::balance_id, cursor );
      if( key.empty() )
        break;

      if( key.size() != protocol::account_size || value.size() != encode::uint128_size )
        return std::unexpected( program_errc::unexpected_object );

      curve::holding h;
      std::ranges::copy( key, h.holder.begin() );
      h.balance = encode::from_little_endian( value.first< encode::uint128_size >() );
      result.push_back( h );

      cursor.assign( key.begin(), key.end() );
    }

    return result;
  }

private:
  system_interface* _system;
};

class custody final: public curve::treasury
{
public:
  explicit custody( system_interface* system ) noexcept:
      _system( system )
  {}

  std::error_code pay( const protocol::account& to, const math::uint128& amount ) override
  {
    return _system->transfer( to, amount );
  }

private:
  system_interface* _system;
};

class handler
{
public:
  explicit handler( system_interface* system ):
      _system( system ),
      _holders( system ),
      _custody( system ),
      _self( to_account( system->get_self() ) ),
      _caller( to_account( system->get_caller() ) )
  {}

  std::error_code load_instance()
  {
    auto state = load< curve::curve_state >( _system, bonding_curve::state_id );
    if( !state )
      return state.error();

    if( !state->has_value() )
      return curve::curve_errc::not_initialized;

    auto config = load< curve::curve_config >( _system, bonding_curve::config_id );
    if( !config )
      return config.error();

    auto metadata = load< curve::token_metadata >( _system, bonding_curve::metadata_id );
    if( !metadata )
      return metadata.error();

    if( !config->has_value() || !metadata->has_value() )
      return program_errc::unexpected_object;

    _state    = std::move( **state );
    _config   = std::move( **config );
    _metadata = std::move( **metadata );
    return program_errc::ok;
  }

  std::error_code operator()( const instruction::initialize& init )
  {
    if( !_system->get_object( bonding_curve::state_id, std::span< const std::byte >{} ).empty() )
      return curve::curve_errc::already_initialized;

    if( auto error = init.parameters.validate(); error )
      return error;

    const auto now = _system->get_time();

    _config           = init.parameters.config;
    _state            = curve::curve_state{};
    _state.created_at = now;

    _metadata.name       = init.parameters.name;
    _metadata.symbol     = init.parameters.symbol;
    _metadata.deployer   = _caller;
    _metadata.currency   = _config.currency;
    _metadata.created_at = now;
    _metadata.data       = init.parameters.data;

    if( auto error = store( _system, bonding_curve::config_id, _config ); error )
      return error;

    if( auto error = store( _system, bonding_curve::metadata_id, _metadata ); error )
      return error;

    return store( _system, bonding_curve::state_id, _state );
  }

  std::error_code operator()( const instruction::buy& b )
  {
    auto lc = make_lifecycle();
    auto t  = lc.buy( _caller, _system->get_attached_value(), b.min_tokens_out, _system->get_time() );
    if( !t )
      return t.error();

    return settle( *t );
  }

  std::error_code operator()( const instruction::sell& s )
  {
    auto lc = make_lifecycle();
    auto t  = lc.sell( _caller, s.amount, s.min_base_out, _system->get_time() );
    if( !t )
      return t.error();

    return settle( *t );
  }

  std::error_code operator()( const instruction::get_buy_quote& q )
  {
    curve::pricing_engine pricing( _config );
    auto cost = pricing.quote_buy( _state.current_supply, q.amount );
    if( !cost )
      return cost.error();

    return write( encode::writer().write_uint128( *cost ) );
  }

  std::error_code operator()( const instruction::get_sell_quote& q )
  {
    curve::pricing_engine pricing( _config );
    auto payout = pricing.quote_sell( _state.current_supply, q.amount );
    if( !payout )
      return payout.error();

    return write( encode::writer().write_uint128( *payout ) );
  }

  std::error_code operator()( const instruction::graduate& )
  {
    auto lc     = make_lifecycle();
    auto record = lc.graduate( _system->get_time() );
    if( !record )
      return record.error();

    if( auto error = store( _system, bonding_curve::state_id, _state ); error )
      return error;

    if( auto error = store( _system, bonding_curve::record_id, *record ); error )
      return error;

    return write( encode::writer().write_bytes( record->pool ) );
  }

  std::error_code operator()( const instruction::get_state& )
  {
    return _system->write( file_descriptor::stdout, encode::to_archive( _state ) );
  }

  std::error_code operator()( const instruction::transfer& t )
  {
    auto lc = make_lifecycle();
    if( auto error = lc.transfer( _caller, t.to, t.amount ); error )
      return error;

    return store( _system, bonding_curve::state_id, _state );
  }

  std::error_code operator()( const instruction::get_name& )
  {
    return write( encode::writer().write_string( _metadata.name ) );
  }

  std::error_code operator()( const instruction::get_symbol& )
  {
    return write( encode::writer().write_string( _metadata.symbol ) );
  }

  std::error_code operator()( const instruction::get_supply& )
  {
    return write( encode::writer().write_uint128( _state.current_supply ) );
  }

  std::error_code operator()( const instruction::get_reserves& )
  {
    return write( encode::writer().write_uint128( _state.base_reserves ) );
  }

  std::error_code operator()( const instruction::get_pool& )
  {
    encode::writer w;
    w.write_bool( _state.pool.has_value() );
    if( _state.pool )
      w.write_bytes( *_state.pool );

    return write( w );
  }

  std::error_code operator()( const instruction::is_graduated& )
  {
    return write( encode::writer().write_bool( _state.phase == curve::lifecycle_phase::graduated ) );
  }

  std::error_code operator()( const instruction::balance_of& b )
  {
    auto balance = _holders.balance_of( b.holder );
    if( !balance )
      return balance.error();

    return write( encode::writer().write_uint128( *balance ) );
  }

  std::error_code operator()( const instruction::get_graduation_record& )
  {
    auto object = _system->get_object( bonding_curve::record_id, std::span< const std::byte >{} );
    if( object.empty() )
      return curve::curve_errc::not_graduated;

    return _system->write( file_descriptor::stdout, object );
  }

  std::error_code operator()( const instruction::get_data& )
  {
    return _system->write( file_descriptor::stdout, encode::to_archive( _metadata ) );
  }

private:
  curve::lifecycle make_lifecycle()
  {
    return curve::lifecycle( _config, _state, _holders, _custody, _system->amm(), _self, _metadata.deployer );
  }

  // Persists the state after a trade and reports tokens, base amount, refund and graduation
  std::error_code settle( const curve::trade& t )
  {
    if( auto error = store( _system, bonding_curve::state_id, _state ); error )
      return error;

    if( t.graduation )
      if( auto error = store( _system, bonding_curve::record_id, *t.graduation ); error )
        return error;

    LOG_DEBUG( emissio::log::instance(),
               "{} {} tokens of {} for {}",
               t.direction == curve::trade_direction::buy ? "Bought" : "Sold",
               emissio::log::amount{ t.tokens },
               _metadata.symbol,
               emissio::log::amount{ t.base_amount } );

    return write( encode::writer()
                    .write_uint128( t.tokens )
                    .write_uint128( t.base_amount )
                    .write_uint128( t.refund )
                    .write_bool( t.graduation.has_value() ) );
  }

  std::error_code write( const encode::writer& w )
  {
    return _system->write( file_descriptor::stdout, w.data() );
  }

  system_interface* _system;
  object_holder_book _holders;
  custody _custody;
  protocol::account _self;
  protocol::account _caller;

  curve::curve_config _config;
  curve::curve_state _state;
  curve::token_metadata _metadata;
};

} // namespace

std::error_code bonding_curve::run( system_interface* system, std::span< const std::string > )
{
  stdin_source source( system );

  auto request = instruction::decode( source );
  if( !request )
    return request.error();

  if( !std::holds_alternative< instruction::buy >( *request ) && system->get_attached_value() > 0 )
    return curve::curve_errc::invalid_argument;

  handler h( system );

  if( !std::holds_alternative< instruction::initialize >( *request ) )
    if( auto error = h.load_instance(); error )
      return error;

  return std::visit( h, *request );
}

} // namespace emissio::program
