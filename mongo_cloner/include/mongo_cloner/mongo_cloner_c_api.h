#ifndef _mongo_cloner_c_api_h_
#define _mongo_cloner_c_api_h_

#ifdef __cplusplus
extern "C"{
#endif 

typedef void (*mongo_cloner_on_log_callback_f)(const void* context, const char* line);

/* All functions return 0 on success and 1 on failure. Every progress and
   error line is passed to on_log (may be NULL) before the call returns.
   batch_size 0 selects the default of 1000. */

int mongo_cloner_direct_clone(
      const char* src_uri
    , const char* src_db
    , const char* dst_uri
    , const char* dst_db
    , unsigned int batch_size
    , const void* context
    , mongo_cloner_on_log_callback_f on_log);

int mongo_cloner_dump_to_file(
      const char* uri
    , const char* db_name
    , const char* output_directory
    , unsigned int batch_size
    , const void* context
    , mongo_cloner_on_log_callback_f on_log);

int mongo_cloner_restore_from_file(
      const char* uri
    , const char* db_name
    , const char* input_directory
    , unsigned int batch_size
    , const void* context
    , mongo_cloner_on_log_callback_f on_log);

#ifdef __cplusplus
}
#endif

#endif
